#include "PanelViewer.hpp"

#include <gtest/gtest.h>

namespace
{
QImage
grayImage(int w, int h)
{
    QImage image(w, h, QImage::Format_RGB32);
    image.fill(Qt::gray);
    return image;
}
} // namespace

TEST(PanelViewer, CentersTheCropByDefault)
{
    PanelViewer viewer(PanelCompositor::Style{}, TapRouter::Zones{});
    viewer.resize(600, 800);
    viewer.updateImage(grayImage(300, 400));

    EXPECT_FALSE(viewer.customPosition().has_value());
    EXPECT_EQ(viewer.displayRect(), QRect(150, 200, 300, 400));
}

TEST(PanelViewer, PinnedAnchorIsUsedVerbatim)
{
    PanelViewer viewer(PanelCompositor::Style{}, TapRouter::Zones{});
    viewer.resize(600, 800);
    viewer.updateImage(grayImage(300, 400));

    viewer.setCustomPosition(QPoint(10, 20));
    EXPECT_EQ(viewer.displayRect(), QRect(10, 20, 300, 400));

    // Survives a crop swap
    viewer.updateImage(grayImage(200, 100));
    EXPECT_EQ(viewer.displayRect(), QRect(10, 20, 200, 100));

    viewer.setCustomPosition(std::nullopt);
    EXPECT_EQ(viewer.displayRect(), QRect(200, 350, 200, 100));
}

TEST(PanelViewer, FollowsItsOwnSize)
{
    PanelViewer viewer(PanelCompositor::Style{}, TapRouter::Zones{});
    viewer.resize(600, 800);
    viewer.updateImage(grayImage(300, 400));

    viewer.resize(1000, 800);
    EXPECT_EQ(viewer.displayRect(), QRect(350, 200, 300, 400));
}

TEST(PanelViewer, CenterTapRequestsClose)
{
    PanelViewer viewer(PanelCompositor::Style{}, TapRouter::Zones{});
    viewer.resize(600, 800);
    int closes{0}, forwards{0};
    QObject::connect(&viewer, &PanelViewer::closeRequested,
                     [&closes]() { ++closes; });
    QObject::connect(&viewer, &PanelViewer::forwardRequested,
                     [&forwards]() { ++forwards; });

    viewer.handleTap(QPoint(300, 400));
    viewer.handleTap(QPoint(590, 400));

    EXPECT_EQ(closes, 1);
    EXPECT_EQ(forwards, 1);
}
