#include "DocumentView.hpp"

#include "Config.hpp"
#include "utils.hpp"

#include <QDebug>
#include <QPainter>
#include <algorithm>
#include <cmath>

DocumentView::DocumentView(const Config &config, QWidget *parent) noexcept
    : QWidget(parent), m_config(config)
{
#ifndef NDEBUG
    qDebug() << "DocumentView::DocumentView(): Initializing DocumentView";
#endif

    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);

    m_model.setZoom(m_config.rendering.zoom);

    m_render_timer = new QTimer(this);
    m_render_timer->setSingleShot(true);
    m_render_timer->setInterval(0);
    connect(m_render_timer, &QTimer::timeout, this,
            &DocumentView::renderCurrentPage);
}

DocumentView::~DocumentView() noexcept
{
    m_render_timer->stop();
    m_model.cleanup();
}

bool
DocumentView::openFile(const QString &filePath, int startPage) noexcept
{
    qDebug() << "DocumentView::openFile(): Opening file:" << filePath;

    if (!m_model.openFile(filePath))
    {
        emit openFileFailed(filePath);
        return false;
    }

    m_start_page    = startPage;
    m_pageno        = std::clamp(startPage - 1, 0,
                                 std::max(0, m_model.numPages() - 1));
    m_rendered_page = -1;
    m_page_image    = QImage();
    renderCurrentPage();

    emit fileOpened(m_model.filePath());
    emit pageChanged(pageNo(), numPages());
    return true;
}

void
DocumentView::closeFile() noexcept
{
    m_render_timer->stop();
    m_model.cleanup();
    m_page_image    = QImage();
    m_page_rect     = QRect();
    m_pageno        = 0;
    m_rendered_page = -1;
    update();
    emit fileClosed();
}

bool
DocumentView::gotoPage(int pageno) noexcept
{
    if (!isOpen())
        return false;

    const int target = std::clamp(pageno - 1, 0, numPages() - 1);
    if (target == m_pageno)
        return false;

    m_pageno = target;
    requestRender();
    emit pageChanged(pageNo(), numPages());
    return true;
}

void
DocumentView::nextPage() noexcept
{
    gotoPage(pageNo() + 1);
}

void
DocumentView::prevPage() noexcept
{
    gotoPage(pageNo() - 1);
}

void
DocumentView::firstPage() noexcept
{
    gotoPage(1);
}

void
DocumentView::lastPage() noexcept
{
    gotoPage(numPages());
}

void
DocumentView::requestRender() noexcept
{
    m_render_timer->start();
}

QRect
DocumentView::fittedPageRect() const noexcept
{
    const std::optional<QSizeF> bounds = m_model.pageBounds(m_pageno);
    if (!bounds || width() <= 0 || height() <= 0)
        return QRect();

    const double scale = std::min(width() / bounds->width(),
                                  height() / bounds->height());
    const int w = static_cast<int>(std::lround(bounds->width() * scale));
    const int h = static_cast<int>(std::lround(bounds->height() * scale));

    return QRect((width() - w) / 2, (height() - h) / 2, w, h);
}

void
DocumentView::renderCurrentPage() noexcept
{
    if (!isOpen())
        return;

    m_page_rect = fittedPageRect();
    if (m_page_rect.isEmpty())
    {
        m_page_image    = QImage();
        m_rendered_page = -1;
        update();
        return;
    }

    m_page_image = m_model.renderPage(m_pageno, m_page_rect.size());
    if (m_page_image.isNull())
    {
        qWarning() << "DocumentView::renderCurrentPage(): Failed to render page"
                   << pageNo();
        m_rendered_page = -1;
    }
    else
    {
        m_rendered_page = m_pageno;
    }

    update();
}

std::vector<HostDocument::PageProbe>
DocumentView::pageNumberProbes() const noexcept
{
    std::vector<PageProbe> probes;
    probes.reserve(3);

    probes.push_back({"DocumentView::pageNo", [this]() -> std::optional<int>
    {
        if (!isOpen())
            return std::nullopt;
        return pageNo();
    }});

    probes.push_back({"DocumentView::renderedPage",
                      [this]() -> std::optional<int>
    {
        if (m_rendered_page < 0)
            return std::nullopt;
        return m_rendered_page + 1;
    }});

    probes.push_back({"DocumentView::startPage", [this]() -> std::optional<int>
    {
        if (m_start_page < 1)
            return std::nullopt;
        return m_start_page;
    }});

    return probes;
}

std::optional<QRect>
DocumentView::viewArea() const noexcept
{
    if (m_page_rect.isEmpty() || m_rendered_page != m_pageno)
        return std::nullopt;
    return m_page_rect;
}

std::optional<QSize>
DocumentView::nativePageSize(int pageno) const noexcept
{
    return m_model.pageSize(pageno - 1);
}

QImage
DocumentView::cropPageRegion(int pageno, const DisplayRect &frame,
                             const PixelRect &rect) noexcept
{
    return m_model.renderPageRegion(pageno - 1, frame.size(), rect);
}

void
DocumentView::turnPage(int direction) noexcept
{
    if (direction > 0)
        nextPage();
    else if (direction < 0)
        prevPage();
}

QString
DocumentView::documentPath() const noexcept
{
    return m_model.filePath();
}

QString
DocumentView::pageFilename(int pageno) const noexcept
{
    return m_model.pageFilename(pageno - 1);
}

QSize
DocumentView::screenSize() const noexcept
{
    const QWidget *top = window();
    return top ? top->size() : size();
}

bool
DocumentView::ditheringEnabled() const noexcept
{
    return m_config.panel_zoom.dithering;
}

PanelZoomHandler *
DocumentView::panelZoomHandler() const noexcept
{
    return m_panel_zoom_handler;
}

void
DocumentView::setPanelZoomHandler(PanelZoomHandler *handler) noexcept
{
    m_panel_zoom_handler = handler;
}

void
DocumentView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), rgbaToQColor(m_config.colors.background));

    if (m_page_image.isNull())
        return;

    painter.fillRect(m_page_rect, rgbaToQColor(m_config.colors.page_background));
    painter.drawImage(m_page_rect.topLeft(), m_page_image);
}

void
DocumentView::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    requestRender();
}

void
DocumentView::mousePressEvent(QMouseEvent *event)
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
DocumentView::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || !isOpen())
    {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    const QPoint pos = event->position().toPoint();
    if ((pos - m_press_pos).manhattanLength() > 10)
        return;

    event->accept();

    if (m_panel_zoom_handler && m_panel_zoom_handler->handlePanelZoom(pos))
        return;

    if (pos.x() >= width() / 2)
        nextPage();
    else
        prevPage();
}

void
DocumentView::keyPressEvent(QKeyEvent *event)
{
    switch (event->key())
    {
        case Qt::Key_Right:
        case Qt::Key_PageDown:
        case Qt::Key_Space:
            nextPage();
            break;
        case Qt::Key_Left:
        case Qt::Key_PageUp:
        case Qt::Key_Backspace:
            prevPage();
            break;
        case Qt::Key_Home:
            firstPage();
            break;
        case Qt::Key_End:
            lastPage();
            break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }

    event->accept();
}
