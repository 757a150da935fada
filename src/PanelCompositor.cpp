#include "PanelCompositor.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace
{
// 8x8 Bayer threshold matrix, values 0..63
constexpr std::array<std::array<int, 8>, 8> BAYER8 = {{
    {0, 32, 8, 40, 2, 34, 10, 42},
    {48, 16, 56, 24, 50, 18, 58, 26},
    {12, 44, 4, 36, 14, 46, 6, 38},
    {60, 28, 52, 20, 62, 30, 54, 22},
    {3, 35, 11, 43, 1, 33, 9, 41},
    {51, 19, 59, 27, 49, 17, 57, 25},
    {15, 47, 7, 39, 13, 45, 5, 37},
    {63, 31, 55, 23, 61, 29, 53, 21},
}};

constexpr int GRAY_LEVELS = 16;
} // namespace

QRect
PanelCompositor::placement(const QSize &cropSize, const QSize &screenSize,
                           const std::optional<QPoint> &anchor) noexcept
{
    if (anchor)
        return QRect(*anchor, cropSize);

    const int x = static_cast<int>(
        std::floor((screenSize.width() - cropSize.width()) / 2.0 + 0.5));
    const int y = static_cast<int>(
        std::floor((screenSize.height() - cropSize.height()) / 2.0 + 0.5));

    return QRect(x, y, cropSize.width(), cropSize.height());
}

std::array<QRect, 4>
PanelCompositor::letterboxBands(const QRect &placement,
                                const QSize &screenSize) noexcept
{
    const int sw = screenSize.width();
    const int sh = screenSize.height();

    const int top    = std::clamp(placement.y(), 0, sh);
    const int bottom = std::clamp(placement.y() + placement.height(), top, sh);
    const int left   = std::clamp(placement.x(), 0, sw);
    const int right  = std::clamp(placement.x() + placement.width(), left, sw);
    const int middle = bottom - top;

    return {
        QRect(0, 0, sw, top),
        QRect(0, bottom, sw, sh - bottom),
        QRect(0, top, left, middle),
        QRect(right, top, sw - right, middle),
    };
}

bool
PanelCompositor::isSquarish(const QRect &placement) const noexcept
{
    if (placement.height() <= 0)
        return false;

    const double aspect
        = static_cast<double>(placement.width()) / placement.height();
    return aspect >= m_style.square_min_aspect
           && aspect <= m_style.square_max_aspect;
}

std::array<QRect, 2>
PanelCompositor::borderBands(const QRect &placement) const noexcept
{
    const int side   = m_style.side_thickness;
    const int reach  = m_style.border_thickness;
    const int top    = placement.y() - reach;
    const int height = placement.height() + 2 * reach;

    // Only the left band grows inward for near-square panels; the right
    // band's extension stays at zero.
    const int left_ext  = isSquarish(placement) ? m_style.square_extension : 0;
    const int right_ext = 0;

    return {
        QRect(placement.x() - side, top, side + left_ext, height),
        QRect(placement.x() + placement.width() - right_ext, top,
              side + right_ext, height),
    };
}

void
PanelCompositor::paint(QPainter &painter, const QImage &crop,
                       const QSize &screenSize,
                       const std::optional<QPoint> &anchor,
                       bool dither) const noexcept
{
    if (crop.isNull() || screenSize.isEmpty())
        return;

    const QRect rect = placement(crop.size(), screenSize, anchor);

    for (const QRect &band : letterboxBands(rect, screenSize))
    {
        if (!band.isEmpty())
            painter.fillRect(band, m_style.background);
    }

    if (dither)
        painter.drawImage(rect.topLeft(), ditherToGray16(crop));
    else
        painter.drawImage(rect.topLeft(), crop);

    for (const QRect &band : borderBands(rect))
        painter.fillRect(band, m_style.border);

#ifndef NDEBUG
    qDebug() << "PanelCompositor::paint(): Placement" << rect << "squarish"
             << isSquarish(rect) << "dither" << dither;
#endif
}

QImage
PanelCompositor::render(const QImage &crop, const QSize &screenSize,
                        const std::optional<QPoint> &anchor,
                        bool dither) const noexcept
{
    if (screenSize.isEmpty())
        return QImage();

    QImage frame(screenSize, QImage::Format_RGB32);
    if (frame.isNull())
    {
        qWarning() << "PanelCompositor::render(): Cannot allocate frame of"
                   << screenSize;
        return QImage();
    }

    frame.fill(m_style.background);
    QPainter painter(&frame);
    paint(painter, crop, screenSize, anchor, dither);
    painter.end();
    return frame;
}

// Ordered dithering down to the 16 gray levels an e-ink panel can show.
QImage
PanelCompositor::ditherToGray16(const QImage &image) noexcept
{
    if (image.isNull())
        return QImage();

    QImage gray = image.convertToFormat(QImage::Format_Grayscale8);
    if (gray.isNull())
        return QImage();

    constexpr int max_level = GRAY_LEVELS - 1;
    constexpr int step      = 255 / max_level;

    for (int y = 0; y < gray.height(); ++y)
    {
        uchar *row = gray.scanLine(y);
        const auto &thresholds = BAYER8[y & 7];
        for (int x = 0; x < gray.width(); ++x)
        {
            const int scaled = row[x] * max_level;
            int level        = scaled / 255;
            const int frac   = scaled % 255;
            if (frac * 64 > thresholds[x & 7] * 255)
                ++level;
            row[x] = static_cast<uchar>(std::min(level, max_level) * step);
        }
    }

    return gray;
}
