#pragma once

#include "PanelTypes.hpp"
#include "PanelZoomHandler.hpp"

#include <QImage>
#include <QRect>
#include <QSize>
#include <QString>
#include <functional>
#include <optional>
#include <vector>

// What the panel-zoom controller needs from the reader hosting it.
class HostDocument
{
public:
    // One way of asking the host for the current page.
    struct PageProbe
    {
        const char *name;
        std::function<std::optional<int>()> probe;
    };

    virtual ~HostDocument() = default;

    // Tried in order; see resolveCurrentPage().
    virtual std::vector<PageProbe> pageNumberProbes() const noexcept = 0;

    // Visible page area of the viewport, if the host has laid out a page.
    virtual std::optional<QRect> viewArea() const noexcept = 0;
    virtual std::optional<QSize> nativePageSize(int pageno) const noexcept = 0;

    // `rect` is in the pixel space of `frame` (the page scaled to the frame's
    // size). A null image means the crop could not be produced.
    virtual QImage cropPageRegion(int pageno, const DisplayRect &frame,
                                  const PixelRect &rect) noexcept = 0;

    // `direction` is +1 or -1. Completes asynchronously from the caller's
    // point of view.
    virtual void turnPage(int direction) noexcept = 0;

    virtual QString documentPath() const noexcept = 0;
    virtual QString pageFilename(int pageno) const noexcept = 0;
    virtual QSize screenSize() const noexcept = 0;
    virtual bool ditheringEnabled() const noexcept = 0;

    // Gesture dispatch slot consulted before the host's own tap handling.
    virtual PanelZoomHandler *panelZoomHandler() const noexcept = 0;
    virtual void setPanelZoomHandler(PanelZoomHandler *handler) noexcept = 0;
};

int resolveCurrentPage(const std::vector<HostDocument::PageProbe> &probes,
                       int fallback = 1) noexcept;
