#pragma once

#include "PanelTypes.hpp"

#include <optional>

// Panel traversal state for the current page.
//
// `Empty` when no panels are loaded (or after `close()`), otherwise
// `Active(index)` with a 1-based index into the panel list. Reaching either
// end of the list is reported to the caller, who turns the page and loads the
// next page's panels.
class NavigationState
{
public:
    enum class Position
    {
        First = 0,
        Last
    };

    enum class Step
    {
        StayOnPage = 0,
        ExhaustedForward,
        ExhaustedBackward,
        Empty
    };

    NavigationState() = default;

    void load(PanelList panels, Position position = Position::First) noexcept;
    Step advance() noexcept;
    Step retreat() noexcept;
    void moveTo(Position position) noexcept;
    void close() noexcept;
    void reset() noexcept;

    bool needsReload(int currentPage) const noexcept;
    std::optional<PanelData> current() const noexcept;

    inline int index() const noexcept
    {
        return m_index;
    }

    inline int count() const noexcept
    {
        return static_cast<int>(m_panels.size());
    }

    inline const PanelList &panels() const noexcept
    {
        return m_panels;
    }

    inline bool isActive() const noexcept
    {
        return !m_closed && !m_panels.empty();
    }

    inline bool isClosed() const noexcept
    {
        return m_closed;
    }

    inline std::optional<int> lastPage() const noexcept
    {
        return m_last_page;
    }

    inline void setLastPage(int pageno) noexcept
    {
        m_last_page = pageno;
    }

private:
    PanelList m_panels;
    int m_index{1};
    std::optional<int> m_last_page;
    bool m_closed{false};
};
