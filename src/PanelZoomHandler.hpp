#pragma once

#include <QPoint>

// Handler slot the document view consults before its own click handling.
// Returning true consumes the gesture.
class PanelZoomHandler
{
public:
    virtual ~PanelZoomHandler() = default;
    virtual bool handlePanelZoom(const QPoint &pos) noexcept = 0;
};
