#pragma once

#include "HostDocument.hpp"
#include "NavigationState.hpp"
#include "PanelCatalog.hpp"
#include "PanelCompositor.hpp"
#include "PanelViewer.hpp"
#include "PanelZoomHandler.hpp"
#include "TapRouter.hpp"

#include <QObject>
#include <QPointer>
#include <QTimer>

// Panel-by-panel navigation on top of a host reader.
//
// While enabled, the controller sits in the host's panel-zoom handler slot.
// A tap on the page opens the first panel of the current page in a
// PanelViewer; taps inside the viewer step through the panels and turn the
// page when they run out. After a page turn the controller waits for the
// host to settle (single-shot timer) before resolving the new page's panels.
class PanelZoomController : public QObject, public PanelZoomHandler
{
    Q_OBJECT

public:
    struct Options
    {
        TapRouter::Zones zones{};
        PanelCompositor::Style style{};
        int settle_delay_ms{300};
        bool use_view_area{true};
        QString sidecar_path{}; // overrides the path next to the document
    };

    PanelZoomController(HostDocument *host, QWidget *viewerParent,
                        const Options &options,
                        QObject *parent = nullptr) noexcept;
    ~PanelZoomController() noexcept;

    void setEnabled(bool enabled) noexcept;
    void toggleIntegration() noexcept;
    void documentChanged() noexcept;
    bool handlePanelZoom(const QPoint &pos) noexcept override;
    bool displayCurrentPanel() noexcept;
    void closeViewer() noexcept;

    inline bool isEnabled() const noexcept
    {
        return m_enabled;
    }

    inline bool isSettling() const noexcept
    {
        return m_settle_timer.isActive();
    }

    inline const NavigationState &state() const noexcept
    {
        return m_state;
    }

    inline ReadingDirection readingDirection() const noexcept
    {
        return m_direction;
    }

    inline PanelViewer *viewer() const noexcept
    {
        return m_viewer.data();
    }

    inline const Options &options() const noexcept
    {
        return m_options;
    }

    void setOptions(const Options &options) noexcept;

signals:
    void notice(const QString &message, float seconds);
    void enabledChanged(bool enabled);
    void viewerClosed();

public slots:
    void handleForward() noexcept;
    void handleBackward() noexcept;
    void handleClose() noexcept;

private slots:
    void handleSettled() noexcept;
    void handleHostDestroyed() noexcept;

private:
    void step(TapRouter::Action action) noexcept;
    void changePage(int direction) noexcept;
    bool importPanels(int pageno, NavigationState::Position position) noexcept;
    void ensureCatalog() noexcept;
    int currentPage() const noexcept;
    PanelViewer *ensureViewer() noexcept;

    HostDocument *m_host{nullptr};
    QPointer<QWidget> m_viewer_parent;
    Options m_options;

    PanelCatalog m_catalog;
    bool m_catalog_attempted{false};
    NavigationState m_state;
    ReadingDirection m_direction{ReadingDirection::LTR};

    QPointer<PanelViewer> m_viewer;
    QTimer m_settle_timer;
    int m_pending_direction{0};

    PanelZoomHandler *m_previous_handler{nullptr};
    bool m_enabled{false};
};
