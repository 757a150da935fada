#include "PanelZoomController.hpp"

#include "RegionResolver.hpp"

#include <QDebug>
#include <QFileInfo>

PanelZoomController::PanelZoomController(HostDocument *host,
                                         QWidget *viewerParent,
                                         const Options &options,
                                         QObject *parent) noexcept
    : QObject(parent), m_host(host), m_viewer_parent(viewerParent),
      m_options(options)
{
    m_settle_timer.setSingleShot(true);
    connect(&m_settle_timer, &QTimer::timeout, this,
            &PanelZoomController::handleSettled);

    // Widget hosts may be torn down before the controller
    if (auto *object = dynamic_cast<QObject *>(host))
        connect(object, &QObject::destroyed, this,
                &PanelZoomController::handleHostDestroyed);
}

PanelZoomController::~PanelZoomController() noexcept
{
    m_settle_timer.stop();
    if (m_enabled && m_host && m_host->panelZoomHandler() == this)
        m_host->setPanelZoomHandler(m_previous_handler);
    delete m_viewer.data();
}

void
PanelZoomController::setOptions(const Options &options) noexcept
{
    const bool sidecar_changed = options.sidecar_path != m_options.sidecar_path;
    m_options                  = options;
    if (sidecar_changed)
    {
        m_catalog.clear();
        m_catalog_attempted = false;
    }
}

void
PanelZoomController::setEnabled(bool enabled) noexcept
{
    if (enabled == m_enabled)
        return;

    m_enabled = enabled;

    if (m_enabled)
    {
        m_state.reset();
        m_catalog.clear();
        m_catalog_attempted = false;

        if (m_host)
        {
            m_previous_handler = m_host->panelZoomHandler();
            m_host->setPanelZoomHandler(this);
        }
    }
    else
    {
        // A page turn still settling must not reopen the viewer
        m_settle_timer.stop();
        m_pending_direction = 0;
        closeViewer();
        m_state.reset();

        if (m_host && m_host->panelZoomHandler() == this)
            m_host->setPanelZoomHandler(m_previous_handler);
        m_previous_handler = nullptr;
    }

    qInfo() << "PanelZoomController::setEnabled(): Integration"
            << (m_enabled ? "ON" : "OFF");
    emit notice(m_enabled ? tr("Panel zoom ON") : tr("Panel zoom OFF"), 1);
    emit enabledChanged(m_enabled);
}

void
PanelZoomController::toggleIntegration() noexcept
{
    setEnabled(!m_enabled);
}

void
PanelZoomController::documentChanged() noexcept
{
    m_settle_timer.stop();
    m_pending_direction = 0;
    closeViewer();
    m_state.reset();
    m_catalog.clear();
    m_catalog_attempted = false;
}

bool
PanelZoomController::handlePanelZoom(const QPoint &pos) noexcept
{
    Q_UNUSED(pos);

    if (!m_enabled || !m_host)
        return false;

    if (isSettling())
    {
        qDebug() << "PanelZoomController::handlePanelZoom(): Page turn still "
                    "settling, dropping gesture";
        return true;
    }

    const int page = currentPage();

#ifndef NDEBUG
    qDebug() << "PanelZoomController::handlePanelZoom(): Page" << page
             << "last page" << m_state.lastPage().value_or(-1) << "panels"
             << m_state.count();
#endif

    if (m_state.needsReload(page))
        importPanels(page, NavigationState::Position::First);
    else
        m_state.moveTo(NavigationState::Position::First);

    if (m_state.count() > 0)
        return displayCurrentPanel();

    qWarning() << "PanelZoomController::handlePanelZoom(): No panels found "
                  "for page"
               << page;
    emit notice(tr("No panels found for this page"), 1);
    return false;
}

bool
PanelZoomController::displayCurrentPanel() noexcept
{
    const std::optional<PanelData> panel = m_state.current();
    if (!panel || !m_host)
    {
        qWarning() << "PanelZoomController::displayCurrentPanel(): No panel "
                      "data for index"
                   << m_state.index();
        return false;
    }

    const int page = currentPage();

    const std::optional<QRect> view_area
        = m_options.use_view_area ? m_host->viewArea() : std::nullopt;
    const std::optional<DisplayRect> frame
        = RegionResolver::chooseFrame(view_area, m_host->nativePageSize(page));

    if (!frame)
    {
        qWarning() << "PanelZoomController::displayCurrentPanel(): Could not "
                      "get page dimensions for page"
                   << page;
        closeViewer();
        emit notice(tr("Could not determine the page size"), 1.5);
        return false;
    }

    const std::optional<PixelRect> rect
        = RegionResolver::toPixelRect(*panel, *frame);
    if (!rect)
    {
        closeViewer();
        emit notice(tr("Invalid panel geometry"), 1.5);
        return false;
    }

    if (!RegionResolver::fitsWithin(*rect, *frame))
        qDebug() << "PanelZoomController::displayCurrentPanel(): Panel rect"
                 << *rect << "overflows frame" << *frame;

#ifndef NDEBUG
    qDebug() << "PanelZoomController::displayCurrentPanel(): Panel"
             << m_state.index() << "/" << m_state.count() << "rect" << *rect
             << "frame" << *frame;
#endif

    // Only one decoded crop may be resident
    if (m_viewer)
        m_viewer->freeResources();

    QImage crop = m_host->cropPageRegion(page, *frame, *rect);
    if (crop.isNull())
    {
        qWarning() << "PanelZoomController::displayCurrentPanel(): Could not "
                      "draw page part"
                   << *rect << "of page" << page;
        closeViewer();
        emit notice(tr("Could not render panel"), 1.5);
        return false;
    }

    PanelViewer *viewer = ensureViewer();
    // Follow fullscreen toggles and window resizes
    viewer->setGeometry(QRect(QPoint(0, 0), m_host->screenSize()));
    viewer->setReadingDirection(m_direction);
    viewer->setDithering(m_host->ditheringEnabled());
    viewer->updateImage(std::move(crop));

    if (!viewer->isVisible())
    {
        viewer->show();
        viewer->raise();
        viewer->setFocus();
    }

    return true;
}

PanelViewer *
PanelZoomController::ensureViewer() noexcept
{
    if (m_viewer)
        return m_viewer.data();

    PanelViewer *viewer = new PanelViewer(m_options.style, m_options.zones,
                                          m_viewer_parent.data());

    connect(viewer, &PanelViewer::forwardRequested, this,
            &PanelZoomController::handleForward);
    connect(viewer, &PanelViewer::backwardRequested, this,
            &PanelZoomController::handleBackward);
    connect(viewer, &PanelViewer::closeRequested, this,
            &PanelZoomController::handleClose);

    m_viewer = viewer;
    return viewer;
}

void
PanelZoomController::closeViewer() noexcept
{
    if (!m_viewer)
        return;

    PanelViewer *viewer = m_viewer.data();
    m_viewer            = nullptr;

    viewer->disconnect(this);
    viewer->hide();
    viewer->freeResources();
    // The viewer may be closing from inside one of its own event handlers
    viewer->deleteLater();

    emit viewerClosed();
}

void
PanelZoomController::handleForward() noexcept
{
    step(TapRouter::Action::Forward);
}

void
PanelZoomController::handleBackward() noexcept
{
    step(TapRouter::Action::Backward);
}

void
PanelZoomController::handleClose() noexcept
{
    qDebug() << "PanelZoomController::handleClose(): Closing viewer";
    // Closing is final, a page turn still settling must not reopen the viewer
    m_settle_timer.stop();
    m_pending_direction = 0;
    m_state.close();
    closeViewer();
}

void
PanelZoomController::step(TapRouter::Action action) noexcept
{
    if (isSettling())
    {
        qDebug() << "PanelZoomController::step(): Page turn still settling, "
                    "dropping"
                 << tapActionName(action) << "tap";
        return;
    }

    switch (TapRouter::route(action, m_state))
    {
        case TapRouter::Result::Moved:
            displayCurrentPanel();
            break;

        case TapRouter::Result::TurnForward:
            qDebug() << "PanelZoomController::step(): Last panel reached, "
                        "jumping to next page";
            changePage(1);
            break;

        case TapRouter::Result::TurnBackward:
            qDebug() << "PanelZoomController::step(): First panel reached, "
                        "jumping to previous page";
            changePage(-1);
            break;

        case TapRouter::Result::Close:
            handleClose();
            break;

        case TapRouter::Result::Ignored:
            break;
    }
}

void
PanelZoomController::changePage(int direction) noexcept
{
    if (!m_host)
        return;

    m_pending_direction = direction > 0 ? 1 : -1;
    m_host->turnPage(m_pending_direction);
    m_settle_timer.start(m_options.settle_delay_ms);
}

void
PanelZoomController::handleSettled() noexcept
{
    const int direction = m_pending_direction;
    m_pending_direction = 0;

    if (!m_enabled || !m_host || direction == 0)
        return;

    const int page = currentPage();
    qInfo() << "PanelZoomController::handleSettled(): Changed to page" << page
            << "(diff:" << direction << ")";

    // Forward lands on the first panel, backward on the last one
    importPanels(page, direction > 0 ? NavigationState::Position::First
                                     : NavigationState::Position::Last);

    if (m_state.count() > 0)
    {
        displayCurrentPanel();
        return;
    }

    closeViewer();
    emit notice(tr("No panels on this page"), 1);
}

void
PanelZoomController::handleHostDestroyed() noexcept
{
    qDebug() << "PanelZoomController::handleHostDestroyed(): Host gone, "
                "dropping session";

    m_settle_timer.stop();
    m_pending_direction = 0;
    m_host              = nullptr;
    m_previous_handler  = nullptr;
    m_state.reset();

    // No viewerClosed here, listeners may point at the dying host
    if (m_viewer)
    {
        PanelViewer *viewer = m_viewer.data();
        m_viewer            = nullptr;
        viewer->disconnect(this);
        viewer->hide();
        viewer->deleteLater();
    }
}

bool
PanelZoomController::importPanels(int pageno,
                                  NavigationState::Position position) noexcept
{
    ensureCatalog();

    const QString filename = m_host->pageFilename(pageno);
    PanelCatalog::Lookup lookup = m_catalog.resolve(pageno, filename);

    m_direction = lookup.direction;
    if (m_viewer)
        m_viewer->setReadingDirection(m_direction);

    const bool found = !lookup.panels.empty();
    if (found)
        qInfo() << "PanelZoomController::importPanels(): Loaded"
                << lookup.panels.size() << "panels for page" << pageno;
    else
        qWarning() << "PanelZoomController::importPanels(): No panels match "
                      "page"
                   << pageno << "or filename" << filename;

    m_state.load(std::move(lookup.panels), position);
    m_state.setLastPage(pageno);
    return found;
}

void
PanelZoomController::ensureCatalog() noexcept
{
    if (m_catalog_attempted)
        return;

    m_catalog_attempted = true;

    const QString path = m_options.sidecar_path.isEmpty()
                             ? PanelCatalog::sidecarPathFor(m_host->documentPath())
                             : m_options.sidecar_path;

    if (!m_catalog.load(path))
        emit notice(tr("No panel data for %1").arg(QFileInfo(path).fileName()),
                    1.5);
}

int
PanelZoomController::currentPage() const noexcept
{
    return m_host ? resolveCurrentPage(m_host->pageNumberProbes()) : 1;
}
