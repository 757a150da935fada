#include "TapRouter.hpp"

bool
TapRouter::validZones(const Zones &zones) noexcept
{
    return zones.left >= 0.0 && zones.right <= 1.0 && zones.left < zones.right;
}

TapRouter::Action
TapRouter::classify(double xFraction, ReadingDirection dir) const noexcept
{
    const bool rtl = dir == ReadingDirection::RTL;

    if (xFraction < m_zones.left)
        return rtl ? Action::Forward : Action::Backward;

    if (xFraction > m_zones.right)
        return rtl ? Action::Backward : Action::Forward;

    return Action::Center;
}

TapRouter::Action
TapRouter::classify(const QPoint &pos, int screenWidth,
                    ReadingDirection dir) const noexcept
{
    if (screenWidth <= 0)
        return Action::Center;

    return classify(static_cast<double>(pos.x()) / screenWidth, dir);
}

TapRouter::Result
TapRouter::route(Action action, NavigationState &state) noexcept
{
    if (action == Action::Center)
        return Result::Close;

    const NavigationState::Step step
        = action == Action::Forward ? state.advance() : state.retreat();

    switch (step)
    {
        case NavigationState::Step::StayOnPage:
            return Result::Moved;
        case NavigationState::Step::ExhaustedForward:
            return Result::TurnForward;
        case NavigationState::Step::ExhaustedBackward:
            return Result::TurnBackward;
        case NavigationState::Step::Empty:
            break;
    }

    return Result::Ignored;
}

const char *
tapActionName(TapRouter::Action action) noexcept
{
    switch (action)
    {
        case TapRouter::Action::Forward:
            return "forward";
        case TapRouter::Action::Backward:
            return "backward";
        case TapRouter::Action::Center:
            return "center";
    }
    return "unknown";
}
