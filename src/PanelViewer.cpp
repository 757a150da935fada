#include "PanelViewer.hpp"

#include <QDebug>
#include <QPainter>
#include <utility>

PanelViewer::PanelViewer(const PanelCompositor::Style &style,
                         const TapRouter::Zones &zones,
                         QWidget *parent) noexcept
    : QWidget(parent), m_compositor(style), m_router(zones)
{
    setAttribute(Qt::WA_OpaquePaintEvent);
    setFocusPolicy(Qt::StrongFocus);
    setAutoFillBackground(false);
}

PanelViewer::~PanelViewer() noexcept
{
    freeResources();
}

// Swaps in a new crop without recreating the widget. The previous crop is
// released before the new one is stored.
void
PanelViewer::updateImage(QImage image) noexcept
{
    freeResources();
    m_image = std::move(image);
    update();

#ifndef NDEBUG
    qDebug() << "PanelViewer::updateImage(): Image updated" << m_image.size();
#endif
}

void
PanelViewer::setReadingDirection(ReadingDirection dir) noexcept
{
    m_direction = dir;
#ifndef NDEBUG
    qDebug() << "PanelViewer::setReadingDirection(): Reading direction set to"
             << readingDirectionToString(dir);
#endif
}

void
PanelViewer::setCustomPosition(std::optional<QPoint> pos) noexcept
{
    m_custom_position = pos;
    update();
}

void
PanelViewer::setDithering(bool enabled) noexcept
{
    if (m_dither == enabled)
        return;
    m_dither = enabled;
    update();
}

void
PanelViewer::freeResources() noexcept
{
    m_image = QImage();
}

void
PanelViewer::handleTap(const QPoint &pos) noexcept
{
    const TapRouter::Action action
        = m_router.classify(pos, width(), m_direction);

#ifndef NDEBUG
    qDebug() << "PanelViewer::handleTap():" << tapActionName(action)
             << "tap at" << pos;
#endif
    dispatch(action);
}

void
PanelViewer::dispatch(TapRouter::Action action) noexcept
{
    switch (action)
    {
        case TapRouter::Action::Forward:
            emit forwardRequested();
            break;
        case TapRouter::Action::Backward:
            emit backwardRequested();
            break;
        case TapRouter::Action::Center:
            emit closeRequested();
            break;
    }
}

void
PanelViewer::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    if (m_image.isNull())
    {
        painter.fillRect(rect(), m_compositor.style().background);
        return;
    }

    m_compositor.paint(painter, m_image, size(), m_custom_position, m_dither);
}

void
PanelViewer::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton)
    {
        m_press_pos = event->position().toPoint();
        event->accept();
        return;
    }

    QWidget::mousePressEvent(event);
}

void
PanelViewer::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton)
    {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    const QPoint pos = event->position().toPoint();
    if ((pos - m_press_pos).manhattanLength() > TAP_DISTANCE_THRESHOLD)
    {
        event->ignore();
        return;
    }

    event->accept();
    handleTap(pos);
}

void
PanelViewer::keyPressEvent(QKeyEvent *event)
{
    const bool rtl = m_direction == ReadingDirection::RTL;

    switch (event->key())
    {
        case Qt::Key_Right:
            dispatch(rtl ? TapRouter::Action::Backward
                         : TapRouter::Action::Forward);
            break;
        case Qt::Key_Left:
            dispatch(rtl ? TapRouter::Action::Forward
                         : TapRouter::Action::Backward);
            break;
        case Qt::Key_Space:
        case Qt::Key_PageDown:
            dispatch(TapRouter::Action::Forward);
            break;
        case Qt::Key_Backspace:
        case Qt::Key_PageUp:
            dispatch(TapRouter::Action::Backward);
            break;
        case Qt::Key_Escape:
            dispatch(TapRouter::Action::Center);
            break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }

    event->accept();
}
