#include "NavigationState.hpp"

#include <gtest/gtest.h>

namespace
{
PanelList
threePanels()
{
    return {{0.0, 0.0, 0.5, 0.5}, {0.5, 0.0, 0.5, 0.5}, {0.0, 0.5, 1.0, 0.5}};
}
} // namespace

TEST(NavigationState, StartsEmpty)
{
    NavigationState state;
    EXPECT_FALSE(state.isActive());
    EXPECT_EQ(state.count(), 0);
    EXPECT_FALSE(state.current().has_value());
    EXPECT_FALSE(state.lastPage().has_value());
    EXPECT_EQ(state.advance(), NavigationState::Step::Empty);
    EXPECT_EQ(state.retreat(), NavigationState::Step::Empty);
}

TEST(NavigationState, LoadFirstAndLast)
{
    NavigationState state;
    state.load(threePanels());
    EXPECT_TRUE(state.isActive());
    EXPECT_EQ(state.index(), 1);

    state.load(threePanels(), NavigationState::Position::Last);
    EXPECT_EQ(state.index(), 3);
    EXPECT_EQ(*state.current(), (PanelData{0.0, 0.5, 1.0, 0.5}));
}

TEST(NavigationState, AdvanceUntilExhausted)
{
    NavigationState state;
    state.load(threePanels());

    EXPECT_EQ(state.advance(), NavigationState::Step::StayOnPage);
    EXPECT_EQ(state.index(), 2);
    EXPECT_EQ(state.advance(), NavigationState::Step::StayOnPage);
    EXPECT_EQ(state.index(), 3);
    EXPECT_EQ(state.advance(), NavigationState::Step::ExhaustedForward);
    EXPECT_EQ(state.index(), 3);
}

TEST(NavigationState, RetreatFromFirstIsExhausted)
{
    NavigationState state;
    state.load(threePanels());

    EXPECT_EQ(state.retreat(), NavigationState::Step::ExhaustedBackward);
    EXPECT_EQ(state.index(), 1);
}

TEST(NavigationState, SinglePanelExhaustsBothWays)
{
    NavigationState state;
    state.load({PanelData{}});

    EXPECT_EQ(state.advance(), NavigationState::Step::ExhaustedForward);
    EXPECT_EQ(state.retreat(), NavigationState::Step::ExhaustedBackward);
    EXPECT_EQ(state.index(), 1);
}

TEST(NavigationState, LoadingNothingLeavesItEmpty)
{
    NavigationState state;
    state.load(threePanels());
    state.load({});

    EXPECT_FALSE(state.isActive());
    EXPECT_EQ(state.advance(), NavigationState::Step::Empty);
}

TEST(NavigationState, CloseThenMoveToReopens)
{
    NavigationState state;
    state.load(threePanels());
    state.advance();
    state.close();

    EXPECT_TRUE(state.isClosed());
    EXPECT_FALSE(state.isActive());
    EXPECT_EQ(state.advance(), NavigationState::Step::Empty);

    state.moveTo(NavigationState::Position::First);
    EXPECT_TRUE(state.isActive());
    EXPECT_EQ(state.index(), 1);
}

TEST(NavigationState, NeedsReload)
{
    NavigationState state;
    EXPECT_TRUE(state.needsReload(1));

    state.load(threePanels());
    EXPECT_TRUE(state.needsReload(1));

    state.setLastPage(4);
    EXPECT_FALSE(state.needsReload(4));
    EXPECT_TRUE(state.needsReload(5));

    state.reset();
    EXPECT_TRUE(state.needsReload(4));
    EXPECT_FALSE(state.lastPage().has_value());
    EXPECT_EQ(state.index(), 1);
}
