#include "PanelCompositor.hpp"

#include <gtest/gtest.h>

namespace
{
int
area(const QRect &r)
{
    return r.isEmpty() ? 0 : r.width() * r.height();
}
} // namespace

TEST(PanelCompositor, CentersCrop)
{
    EXPECT_EQ(PanelCompositor::placement(QSize(400, 300), QSize(1000, 800),
                                         std::nullopt),
              QRect(300, 250, 400, 300));

    // Half pixels round up
    EXPECT_EQ(PanelCompositor::placement(QSize(401, 301), QSize(1000, 800),
                                         std::nullopt)
                  .topLeft(),
              QPoint(300, 250));
}

TEST(PanelCompositor, AnchorIsUsedVerbatim)
{
    EXPECT_EQ(PanelCompositor::placement(QSize(400, 300), QSize(1000, 800),
                                         QPoint(12, 34)),
              QRect(12, 34, 400, 300));
}

TEST(PanelCompositor, LetterboxBandsTileTheScreen)
{
    const QSize screen(1000, 800);
    const QRect placed(300, 250, 400, 300);
    const auto bands = PanelCompositor::letterboxBands(placed, screen);

    EXPECT_EQ(bands[0], QRect(0, 0, 1000, 250));
    EXPECT_EQ(bands[1], QRect(0, 550, 1000, 250));
    EXPECT_EQ(bands[2], QRect(0, 250, 300, 300));
    EXPECT_EQ(bands[3], QRect(700, 250, 300, 300));

    int covered = area(placed);
    for (size_t i = 0; i < bands.size(); ++i)
    {
        covered += area(bands[i]);
        EXPECT_FALSE(bands[i].intersects(placed));
        for (size_t j = i + 1; j < bands.size(); ++j)
            EXPECT_FALSE(bands[i].intersects(bands[j]));
    }
    EXPECT_EQ(covered, screen.width() * screen.height());
}

TEST(PanelCompositor, OversizedCropLeavesNoLetterbox)
{
    const QSize screen(1000, 800);
    const QRect placed
        = PanelCompositor::placement(QSize(1200, 900), screen, std::nullopt);

    for (const QRect &band : PanelCompositor::letterboxBands(placed, screen))
        EXPECT_TRUE(band.isEmpty());
}

TEST(PanelCompositor, SquarishPanelsExtendOnlyTheLeftBorder)
{
    PanelCompositor compositor;
    const QRect placed(300, 250, 400, 300); // aspect 1.33

    ASSERT_TRUE(compositor.isSquarish(placed));
    const auto borders = compositor.borderBands(placed);
    EXPECT_EQ(borders[0], QRect(250, 200, 54, 400));
    EXPECT_EQ(borders[1], QRect(700, 200, 50, 400));
}

TEST(PanelCompositor, WidePanelsGetPlainBorders)
{
    PanelCompositor compositor;
    const QRect placed(100, 300, 800, 200); // aspect 4

    ASSERT_FALSE(compositor.isSquarish(placed));
    const auto borders = compositor.borderBands(placed);
    EXPECT_EQ(borders[0], QRect(50, 250, 50, 300));
    EXPECT_EQ(borders[1], QRect(900, 250, 50, 300));
}

TEST(PanelCompositor, StyleDrivesBorderGeometry)
{
    PanelCompositor compositor({.side_thickness   = 10,
                                .border_thickness = 0,
                                .square_extension = 2});
    const auto borders = compositor.borderBands(QRect(100, 100, 100, 100));
    EXPECT_EQ(borders[0], QRect(90, 100, 12, 100));
    EXPECT_EQ(borders[1], QRect(200, 100, 10, 100));
}

TEST(PanelCompositor, RendersCropOverLetterbox)
{
    QImage crop(400, 300, QImage::Format_RGB32);
    crop.fill(Qt::red);

    PanelCompositor compositor;
    const QImage frame
        = compositor.render(crop, QSize(1000, 800), std::nullopt, false);

    ASSERT_EQ(frame.size(), QSize(1000, 800));
    EXPECT_EQ(frame.pixelColor(0, 0), QColor(Qt::white));
    EXPECT_EQ(frame.pixelColor(500, 400), QColor(Qt::red));
    // Left border eats into the crop, the right one starts at its edge
    EXPECT_EQ(frame.pixelColor(302, 400), QColor(Qt::white));
    EXPECT_EQ(frame.pixelColor(305, 400), QColor(Qt::red));
    EXPECT_EQ(frame.pixelColor(699, 400), QColor(Qt::red));
    EXPECT_EQ(frame.pixelColor(700, 400), QColor(Qt::white));
}

TEST(PanelCompositor, DitherKeepsExtremes)
{
    QImage img(16, 16, QImage::Format_RGB32);
    img.fill(Qt::white);
    QImage out = PanelCompositor::ditherToGray16(img);
    ASSERT_EQ(out.format(), QImage::Format_Grayscale8);
    EXPECT_EQ(qGray(out.pixel(3, 7)), 255);

    img.fill(Qt::black);
    out = PanelCompositor::ditherToGray16(img);
    EXPECT_EQ(qGray(out.pixel(3, 7)), 0);
}

TEST(PanelCompositor, DitherUsesSixteenLevels)
{
    QImage img(8, 8, QImage::Format_Grayscale8);
    img.fill(QColor(128, 128, 128));

    const QImage out = PanelCompositor::ditherToGray16(img);
    int high = 0;
    for (int y = 0; y < out.height(); ++y)
    {
        for (int x = 0; x < out.width(); ++x)
        {
            const int v = out.constScanLine(y)[x];
            EXPECT_EQ(v % 17, 0);
            EXPECT_TRUE(v == 119 || v == 136) << v;
            if (v == 136)
                ++high;
        }
    }
    // 128 sits a little past the middle of the 119..136 step
    EXPECT_EQ(high, 34);
}

TEST(PanelCompositor, NullCropRendersNothing)
{
    PanelCompositor compositor;
    EXPECT_TRUE(PanelCompositor::ditherToGray16(QImage()).isNull());
    EXPECT_TRUE(
        compositor.render(QImage(), QSize(), std::nullopt, false).isNull());
}
