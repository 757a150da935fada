#include "RegionResolver.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
// Sidecars may overhang the page a little, nothing more
constexpr double MIN_ORIGIN = -1.0;
constexpr double MAX_ORIGIN = 2.0;
constexpr double MAX_EXTENT = 2.0;

// Pixel values stay well inside int so that origin + extent cannot overflow
constexpr double MAX_PIXEL = std::numeric_limits<int>::max() / 4;

bool
fitsPixel(double v) noexcept
{
    return v >= -MAX_PIXEL && v <= MAX_PIXEL;
}
} // namespace

namespace RegionResolver
{

bool
isValid(const PanelData &panel) noexcept
{
    if (!std::isfinite(panel.x) || !std::isfinite(panel.y)
        || !std::isfinite(panel.w) || !std::isfinite(panel.h))
        return false;

    return panel.x >= MIN_ORIGIN && panel.x <= MAX_ORIGIN
           && panel.y >= MIN_ORIGIN && panel.y <= MAX_ORIGIN && panel.w > 0
           && panel.w <= MAX_EXTENT && panel.h > 0 && panel.h <= MAX_EXTENT;
}

std::optional<PixelRect>
toPixelRect(const PanelData &panel, const DisplayRect &frame) noexcept
{
    if (!isValid(panel))
    {
        qWarning() << "RegionResolver::toPixelRect(): Rejecting degenerate "
                      "panel"
                   << panel.x << panel.y << panel.w << panel.h;
        return std::nullopt;
    }

    if (frame.width() <= 0 || frame.height() <= 0)
        return std::nullopt;

    const double fw = frame.width();
    const double fh = frame.height();

    const double x = std::floor(panel.x * fw);
    const double y = std::floor(panel.y * fh);
    const double w = std::ceil(panel.w * fw);
    const double h = std::ceil(panel.h * fh);

    if (!fitsPixel(x) || !fitsPixel(y) || !fitsPixel(w) || !fitsPixel(h))
    {
        qWarning() << "RegionResolver::toPixelRect(): Panel out of range for "
                      "frame"
                   << frame;
        return std::nullopt;
    }

    return PixelRect(static_cast<int>(x), static_cast<int>(y),
                     std::max(1, static_cast<int>(w)),
                     std::max(1, static_cast<int>(h)));
}

std::optional<DisplayRect>
chooseFrame(const std::optional<QRect> &viewArea,
            const std::optional<QSize> &nativeSize) noexcept
{
    if (viewArea && viewArea->width() > 0 && viewArea->height() > 0)
        return *viewArea;

    if (nativeSize && nativeSize->width() > 0 && nativeSize->height() > 0)
        return DisplayRect(QPoint(0, 0), *nativeSize);

    return std::nullopt;
}

bool
fitsWithin(const PixelRect &rect, const DisplayRect &frame) noexcept
{
    const qint64 right  = qint64(rect.x()) + rect.width();
    const qint64 bottom = qint64(rect.y()) + rect.height();
    return rect.x() >= 0 && rect.y() >= 0 && right <= frame.width()
           && bottom <= frame.height();
}

} // namespace RegionResolver
