#include "TapRouter.hpp"

#include <gtest/gtest.h>

TEST(TapRouter, ClassifiesLeftToRight)
{
    TapRouter router;
    EXPECT_EQ(router.classify(0.05, ReadingDirection::LTR),
              TapRouter::Action::Backward);
    EXPECT_EQ(router.classify(0.5, ReadingDirection::LTR),
              TapRouter::Action::Center);
    EXPECT_EQ(router.classify(0.95, ReadingDirection::LTR),
              TapRouter::Action::Forward);
}

TEST(TapRouter, RightToLeftSwapsSides)
{
    TapRouter router;
    EXPECT_EQ(router.classify(0.05, ReadingDirection::RTL),
              TapRouter::Action::Forward);
    EXPECT_EQ(router.classify(0.5, ReadingDirection::RTL),
              TapRouter::Action::Center);
    EXPECT_EQ(router.classify(0.95, ReadingDirection::RTL),
              TapRouter::Action::Backward);
}

TEST(TapRouter, ZoneEdgesBelongToCenter)
{
    TapRouter router;
    EXPECT_EQ(router.classify(0.3, ReadingDirection::LTR),
              TapRouter::Action::Center);
    EXPECT_EQ(router.classify(0.7, ReadingDirection::LTR),
              TapRouter::Action::Center);
}

TEST(TapRouter, ClassifiesPixelPositions)
{
    TapRouter router({.left = 0.25, .right = 0.75});
    EXPECT_EQ(router.classify(QPoint(10, 300), 400, ReadingDirection::LTR),
              TapRouter::Action::Backward);
    EXPECT_EQ(router.classify(QPoint(390, 300), 400, ReadingDirection::LTR),
              TapRouter::Action::Forward);
    EXPECT_EQ(router.classify(QPoint(390, 300), 0, ReadingDirection::LTR),
              TapRouter::Action::Center);
}

TEST(TapRouter, ValidZones)
{
    EXPECT_TRUE(TapRouter::validZones({}));
    EXPECT_TRUE(TapRouter::validZones({.left = 0.0, .right = 1.0}));
    EXPECT_FALSE(TapRouter::validZones({.left = 0.6, .right = 0.4}));
    EXPECT_FALSE(TapRouter::validZones({.left = -0.1, .right = 0.7}));
    EXPECT_FALSE(TapRouter::validZones({.left = 0.3, .right = 1.2}));
}

TEST(TapRouter, RoutesThroughNavigationState)
{
    NavigationState state;
    state.load({PanelData{}, PanelData{}});

    EXPECT_EQ(TapRouter::route(TapRouter::Action::Backward, state),
              TapRouter::Result::TurnBackward);
    EXPECT_EQ(TapRouter::route(TapRouter::Action::Forward, state),
              TapRouter::Result::Moved);
    EXPECT_EQ(state.index(), 2);
    EXPECT_EQ(TapRouter::route(TapRouter::Action::Forward, state),
              TapRouter::Result::TurnForward);
    EXPECT_EQ(TapRouter::route(TapRouter::Action::Center, state),
              TapRouter::Result::Close);
}

TEST(TapRouter, EmptyStateIgnoresSteps)
{
    NavigationState state;
    EXPECT_EQ(TapRouter::route(TapRouter::Action::Forward, state),
              TapRouter::Result::Ignored);
    EXPECT_EQ(TapRouter::route(TapRouter::Action::Backward, state),
              TapRouter::Result::Ignored);
}

TEST(TapRouter, ActionNames)
{
    EXPECT_STREQ(tapActionName(TapRouter::Action::Forward), "forward");
    EXPECT_STREQ(tapActionName(TapRouter::Action::Backward), "backward");
    EXPECT_STREQ(tapActionName(TapRouter::Action::Center), "center");
}
