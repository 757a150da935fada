#include "NavigationState.hpp"

#include <QDebug>
#include <utility>

void
NavigationState::load(PanelList panels, Position position) noexcept
{
    m_panels = std::move(panels);
    m_closed = false;

    if (m_panels.empty())
        m_index = 1;
    else
        m_index = position == Position::First ? 1 : count();

#ifndef NDEBUG
    qDebug() << "NavigationState::load(): Loaded" << count()
             << "panels, index" << m_index;
#endif
}

NavigationState::Step
NavigationState::advance() noexcept
{
    if (!isActive())
        return Step::Empty;

    if (m_index < count())
    {
        ++m_index;
        return Step::StayOnPage;
    }

    return Step::ExhaustedForward;
}

NavigationState::Step
NavigationState::retreat() noexcept
{
    if (!isActive())
        return Step::Empty;

    if (m_index > 1)
    {
        --m_index;
        return Step::StayOnPage;
    }

    return Step::ExhaustedBackward;
}

// Repositions within the already loaded panels and reopens a closed state.
void
NavigationState::moveTo(Position position) noexcept
{
    if (m_panels.empty())
        return;

    m_closed = false;
    m_index  = position == Position::First ? 1 : count();
}

// Terminal for the session: nothing is shown again until the next `load()`.
void
NavigationState::close() noexcept
{
    m_closed = true;
}

void
NavigationState::reset() noexcept
{
    m_panels.clear();
    m_index = 1;
    m_last_page.reset();
    m_closed = false;
}

bool
NavigationState::needsReload(int currentPage) const noexcept
{
    return m_panels.empty() || !m_last_page || *m_last_page != currentPage;
}

std::optional<PanelData>
NavigationState::current() const noexcept
{
    if (m_panels.empty() || m_index < 1 || m_index > count())
        return std::nullopt;
    return m_panels[static_cast<size_t>(m_index - 1)];
}
