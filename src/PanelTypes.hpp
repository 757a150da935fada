#pragma once

#include <QRect>
#include <QSize>
#include <QString>
#include <vector>

// One panel of a page, in fractions of the page dimensions.
struct PanelData
{
    double x{0.0};
    double y{0.0};
    double w{1.0};
    double h{1.0};
};

inline bool
operator==(const PanelData &a, const PanelData &b) noexcept
{
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

using PanelList = std::vector<PanelData>;

enum class ReadingDirection
{
    LTR = 0,
    RTL
};

// Pixel-space rectangles (top-left + size). QRect already carries
// exactly this, so the pipeline uses it directly.
using PixelRect   = QRect;
using DisplayRect = QRect;

static inline ReadingDirection
readingDirectionFromString(const QString &str) noexcept
{
    if (str.compare("rtl", Qt::CaseInsensitive) == 0)
        return ReadingDirection::RTL;
    return ReadingDirection::LTR;
}

static inline QString
readingDirectionToString(ReadingDirection dir) noexcept
{
    return dir == ReadingDirection::RTL ? QStringLiteral("rtl")
                                        : QStringLiteral("ltr");
}
