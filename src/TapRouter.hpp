#pragma once

#include "NavigationState.hpp"
#include "PanelTypes.hpp"

#include <QPoint>

class TapRouter
{
public:
    enum class Action
    {
        Forward = 0,
        Backward,
        Center
    };

    enum class Result
    {
        Moved = 0,    // index changed within the page
        TurnForward,  // last panel passed, next page wanted
        TurnBackward, // first panel passed, previous page wanted
        Close,
        Ignored
    };

    // Left zone is [0, left), right zone is (right, 1], the rest is center.
    struct Zones
    {
        double left{0.3};
        double right{0.7};
    };

    TapRouter() = default;
    explicit TapRouter(const Zones &zones) noexcept : m_zones(zones) {}

    inline const Zones &zones() const noexcept
    {
        return m_zones;
    }

    inline void setZones(const Zones &zones) noexcept
    {
        m_zones = zones;
    }

    static bool validZones(const Zones &zones) noexcept;

    Action classify(double xFraction, ReadingDirection dir) const noexcept;
    Action classify(const QPoint &pos, int screenWidth,
                    ReadingDirection dir) const noexcept;

    static Result route(Action action, NavigationState &state) noexcept;

private:
    Zones m_zones{};
};

const char *tapActionName(TapRouter::Action action) noexcept;
