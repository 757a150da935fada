#pragma once

#include "PanelTypes.hpp"

#include <QColor>
#include <QImage>
#include <QPainter>
#include <array>
#include <optional>

// Composes one panel crop onto a full screen: white letterbox around the
// placement, the crop blitted 1:1 (optionally dithered for e-ink), and a
// border band over the left and right edges of the placement.
class PanelCompositor
{
public:
    struct Style
    {
        QColor background{Qt::white};
        QColor border{Qt::white};
        int side_thickness{50};
        int border_thickness{50};  // how far the side bands reach above/below
        int square_extension{4};   // extra inward width of the left band
        double square_min_aspect{0.1};
        double square_max_aspect{1.5};
    };

    PanelCompositor() = default;
    explicit PanelCompositor(const Style &style) noexcept : m_style(style) {}

    inline const Style &style() const noexcept
    {
        return m_style;
    }

    inline void setStyle(const Style &style) noexcept
    {
        m_style = style;
    }

    static QRect placement(const QSize &cropSize, const QSize &screenSize,
                           const std::optional<QPoint> &anchor) noexcept;

    // Top, bottom, left, right. Never overlapping; empty when the placement
    // touches or passes the screen edge.
    static std::array<QRect, 4> letterboxBands(const QRect &placement,
                                               const QSize &screenSize) noexcept;

    bool isSquarish(const QRect &placement) const noexcept;

    // Left, right.
    std::array<QRect, 2> borderBands(const QRect &placement) const noexcept;

    void paint(QPainter &painter, const QImage &crop, const QSize &screenSize,
               const std::optional<QPoint> &anchor, bool dither) const noexcept;

    QImage render(const QImage &crop, const QSize &screenSize,
                  const std::optional<QPoint> &anchor,
                  bool dither) const noexcept;

    static QImage ditherToGray16(const QImage &image) noexcept;

private:
    Style m_style{};
};
