#pragma once

#include "PanelCompositor.hpp"
#include "TapRouter.hpp"

#include <QImage>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QWidget>
#include <optional>

// Full-screen view of a single panel crop. Owns the one decoded crop that is
// resident at any time; taps are classified into forward/backward/center
// and reported through signals.
class PanelViewer : public QWidget
{
    Q_OBJECT

public:
    PanelViewer(const PanelCompositor::Style &style,
                const TapRouter::Zones &zones,
                QWidget *parent = nullptr) noexcept;
    ~PanelViewer() noexcept;

    void updateImage(QImage image) noexcept;
    void setReadingDirection(ReadingDirection dir) noexcept;
    void setCustomPosition(std::optional<QPoint> pos) noexcept;
    void setDithering(bool enabled) noexcept;
    void freeResources() noexcept;

    inline const QImage &image() const noexcept
    {
        return m_image;
    }

    inline ReadingDirection readingDirection() const noexcept
    {
        return m_direction;
    }

    inline bool dithering() const noexcept
    {
        return m_dither;
    }

    inline const std::optional<QPoint> &customPosition() const noexcept
    {
        return m_custom_position;
    }

    // Where the crop lands on screen
    inline QRect displayRect() const noexcept
    {
        return PanelCompositor::placement(m_image.size(), size(),
                                          m_custom_position);
    }

    void handleTap(const QPoint &pos) noexcept;

signals:
    void forwardRequested();
    void backwardRequested();
    void closeRequested();

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    void dispatch(TapRouter::Action action) noexcept;

    PanelCompositor m_compositor;
    TapRouter m_router;
    QImage m_image;
    ReadingDirection m_direction{ReadingDirection::LTR};
    std::optional<QPoint> m_custom_position;
    QPoint m_press_pos;
    bool m_dither{false};

    static constexpr int TAP_DISTANCE_THRESHOLD = 10;
};
