#include "RegionResolver.hpp"

#include <gtest/gtest.h>
#include <limits>

TEST(RegionResolver, SplitsPageInHalves)
{
    const DisplayRect frame(0, 0, 800, 1200);

    const auto left  = RegionResolver::toPixelRect({0.0, 0.0, 0.5, 1.0}, frame);
    const auto right = RegionResolver::toPixelRect({0.5, 0.0, 0.5, 1.0}, frame);

    ASSERT_TRUE(left.has_value());
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(*left, QRect(0, 0, 400, 1200));
    EXPECT_EQ(*right, QRect(400, 0, 400, 1200));
}

TEST(RegionResolver, FloorsOriginAndCeilsExtent)
{
    const auto rect
        = RegionResolver::toPixelRect({0.1, 0.1, 0.3, 0.3}, QRect(0, 0, 333, 333));

    ASSERT_TRUE(rect.has_value());
    EXPECT_EQ(rect->x(), 33);
    EXPECT_EQ(rect->y(), 33);
    EXPECT_EQ(rect->width(), 100);
    EXPECT_EQ(rect->height(), 100);
}

TEST(RegionResolver, FrameOffsetDoesNotMoveTheCrop)
{
    // The frame's position on screen is irrelevant to the crop coordinates
    const auto rect = RegionResolver::toPixelRect({0.25, 0.5, 0.5, 0.5},
                                                  QRect(120, 40, 400, 600));
    ASSERT_TRUE(rect.has_value());
    EXPECT_EQ(*rect, QRect(100, 300, 200, 300));
}

TEST(RegionResolver, TinyPanelsAreAtLeastOnePixel)
{
    const auto rect = RegionResolver::toPixelRect({0.5, 0.5, 0.0001, 0.0001},
                                                  QRect(0, 0, 100, 100));
    ASSERT_TRUE(rect.has_value());
    EXPECT_EQ(rect->width(), 1);
    EXPECT_EQ(rect->height(), 1);
}

TEST(RegionResolver, RejectsDegeneratePanels)
{
    const QRect frame(0, 0, 100, 100);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_FALSE(RegionResolver::toPixelRect({0, 0, 0, 1}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({0, 0, 1, -0.5}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({nan, 0, 1, 1}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({0, 0, inf, 1}, frame));
}

TEST(RegionResolver, RejectsPanelsFarOutsideThePage)
{
    const QRect frame(0, 0, 800, 1200);

    EXPECT_FALSE(RegionResolver::toPixelRect({1e12, 0, 0.5, 0.5}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({0, -1e12, 0.5, 0.5}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({0, 0, 1e10, 1}, frame));
    EXPECT_FALSE(RegionResolver::toPixelRect({0, 0, 1, 1e10}, frame));
}

TEST(RegionResolver, SmallOverhangIsKept)
{
    const QRect frame(0, 0, 100, 100);
    const auto rect = RegionResolver::toPixelRect({0.9, 0.0, 0.2, 1.0}, frame);

    ASSERT_TRUE(rect.has_value());
    EXPECT_EQ(*rect, QRect(90, 0, 20, 100));
    EXPECT_FALSE(RegionResolver::fitsWithin(*rect, frame));
}

TEST(RegionResolver, HugeFrameDoesNotOverflow)
{
    const int big = std::numeric_limits<int>::max() / 2;
    EXPECT_FALSE(RegionResolver::toPixelRect({0.5, 0, 1.0, 1.0},
                                             QRect(0, 0, big, 100)));
    EXPECT_FALSE(RegionResolver::fitsWithin(QRect(big, 0, big, 10),
                                            QRect(0, 0, 100, 100)));
}

TEST(RegionResolver, RejectsEmptyFrame)
{
    EXPECT_FALSE(RegionResolver::toPixelRect({}, QRect(0, 0, 0, 100)));
    EXPECT_FALSE(RegionResolver::toPixelRect({}, QRect()));
}

TEST(RegionResolver, ChooseFramePrefersViewArea)
{
    const auto frame = RegionResolver::chooseFrame(QRect(10, 20, 300, 400),
                                                   QSize(600, 800));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, QRect(10, 20, 300, 400));
}

TEST(RegionResolver, ChooseFrameFallsBackToNativeSize)
{
    auto frame = RegionResolver::chooseFrame(std::nullopt, QSize(600, 800));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, QRect(0, 0, 600, 800));

    frame = RegionResolver::chooseFrame(QRect(), QSize(600, 800));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, QRect(0, 0, 600, 800));

    EXPECT_FALSE(RegionResolver::chooseFrame(std::nullopt, std::nullopt));
    EXPECT_FALSE(RegionResolver::chooseFrame(std::nullopt, QSize(0, 10)));
}

TEST(RegionResolver, FitsWithin)
{
    const QRect frame(0, 0, 100, 100);
    EXPECT_TRUE(RegionResolver::fitsWithin(QRect(0, 0, 100, 100), frame));
    EXPECT_FALSE(RegionResolver::fitsWithin(QRect(50, 0, 51, 100), frame));
    EXPECT_FALSE(RegionResolver::fitsWithin(QRect(-1, 0, 10, 10), frame));
}
