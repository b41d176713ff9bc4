#include "tests/engine_test_common.h"
#include "geoliner/geometry/panel_geometry.h"

using namespace geoliner_test;

TEST(GeometryTest, RectangleCenterIsInsideUnderAnyRotation) {
    for (int deg = 0; deg < 360; deg += 15) {
        const Panel p = makePanel(PanelShape::Rectangle, 40.0f, 70.0f, 15.0f, 100.0f, static_cast<float>(deg));
        EXPECT_TRUE(hitTestPanel(p, panelCenter(p))) << "rotation " << deg;
    }
}

TEST(GeometryTest, RectangleHitFollowsRotation) {
    // Center (50, 10); rotated 90 it spans x 40..60, y -40..60.
    const Panel flat = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 100.0f, 20.0f);
    const Panel turned = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 100.0f, 20.0f, 90.0f);

    EXPECT_TRUE(hitTestPanel(flat, Point2{ 90.0f, 10.0f }));
    EXPECT_FALSE(hitTestPanel(turned, Point2{ 90.0f, 10.0f }));
    EXPECT_TRUE(hitTestPanel(turned, Point2{ 50.0f, 50.0f }));
    EXPECT_FALSE(hitTestPanel(flat, Point2{ 50.0f, 50.0f }));
}

TEST(GeometryTest, RightTriangleUsesBarycentricTest) {
    const Panel p = makePanel(PanelShape::RightTriangle, 0.0f, 0.0f, 100.0f, 100.0f);
    EXPECT_TRUE(hitTestPanel(p, Point2{ 10.0f, 10.0f }));
    EXPECT_TRUE(hitTestPanel(p, Point2{ 0.0f, 0.0f }));
    EXPECT_TRUE(hitTestPanel(p, Point2{ 49.0f, 49.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 90.0f, 90.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 51.0f, 51.0f }));
}

TEST(GeometryTest, RightTriangleRotatesAboutFrameCenter) {
    // Rotated 180 the right angle moves to the local frame's far corner.
    const Panel p = makePanel(PanelShape::RightTriangle, 0.0f, 0.0f, 100.0f, 100.0f, 180.0f);
    EXPECT_TRUE(hitTestPanel(p, Point2{ 90.0f, 90.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 10.0f, 10.0f }));
}

TEST(GeometryTest, EquilateralTriangleIsExact) {
    // Inscribed at (50, 50), r = 50: apex (50, 0), base at y = 75.
    const Panel p = makePanel(PanelShape::Triangle, 0.0f, 0.0f, 100.0f, 100.0f);
    EXPECT_TRUE(hitTestPanel(p, Point2{ 50.0f, 50.0f }));
    EXPECT_TRUE(hitTestPanel(p, Point2{ 50.0f, 2.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 50.0f, 80.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 5.0f, 5.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 95.0f, 70.0f }));
}

TEST(GeometryTest, EquilateralTriangleUsesSmallerDimension) {
    const Panel p = makePanel(PanelShape::Triangle, 0.0f, 0.0f, 200.0f, 100.0f);
    const std::vector<Point2> outline = localOutline(p);
    ASSERT_EQ(outline.size(), 3u);
    expectPointNear(outline[0], Point2{ 100.0f, 0.0f });
    EXPECT_FALSE(hitTestPanel(p, Point2{ 10.0f, 50.0f }));
}

TEST(GeometryTest, PolygonUsesEvenOddRule) {
    // L shape with the notch at the top right.
    const Panel p = makePolygon({
        {0.0f, 0.0f}, {50.0f, 0.0f}, {50.0f, 50.0f}, {100.0f, 50.0f}, {100.0f, 100.0f}, {0.0f, 100.0f},
    });
    EXPECT_TRUE(hitTestPanel(p, Point2{ 25.0f, 25.0f }));
    EXPECT_TRUE(hitTestPanel(p, Point2{ 75.0f, 75.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 75.0f, 25.0f }));
    EXPECT_FALSE(hitTestPanel(p, Point2{ 150.0f, 75.0f }));
}

TEST(GeometryTest, DegenerateShapesNeverHit) {
    const Panel flat = makePanel(PanelShape::RightTriangle, 0.0f, 0.0f, 0.0f, 100.0f);
    EXPECT_TRUE(isDegenerate(flat));
    EXPECT_FALSE(hitTestPanel(flat, Point2{ 0.0f, 50.0f }));

    const Panel line = makePolygon({ {0.0f, 0.0f}, {10.0f, 10.0f}, {20.0f, 20.0f} });
    EXPECT_TRUE(isDegenerate(line));
    EXPECT_FALSE(hitTestPanel(line, Point2{ 10.0f, 10.0f }));

    Panel nan = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 10.0f, 10.0f);
    nan.x = NAN;
    EXPECT_TRUE(isDegenerate(nan));
    EXPECT_FALSE(hitTestPanel(nan, Point2{ 5.0f, 5.0f }));

    const Panel ok = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 10.0f, 10.0f);
    EXPECT_FALSE(hitTestPanel(ok, Point2{ NAN, 5.0f }));
}

TEST(GeometryTest, FootprintCoversRotatedOutline) {
    const Panel p = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 100.0f, 20.0f, 90.0f);
    const AABB f = panelFootprint(p);
    EXPECT_NEAR(f.minX, 40.0f, kEps);
    EXPECT_NEAR(f.maxX, 60.0f, kEps);
    EXPECT_NEAR(f.minY, -40.0f, kEps);
    EXPECT_NEAR(f.maxY, 60.0f, kEps);
}

TEST(GeometryTest, LocalWorldConversionRoundTrips) {
    const Panel p = makePanel(PanelShape::Rectangle, 12.0f, 34.0f, 50.0f, 20.0f, 37.0f);
    const Point2 local{ 7.5f, 3.25f };
    expectPointNear(worldToLocal(p, localToWorld(p, local)), local);
}

TEST(GeometryTest, HandlePositionsFollowRotation) {
    const Panel p = makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 100.0f, 60.0f, 90.0f);
    // Center (50, 30); local SE offset (50, 30) maps to (-30, 50).
    expectPointNear(cornerHandlePosition(p, interaction_constants::CornerIndex::SOUTH_EAST), Point2{ 20.0f, 80.0f });
    // Top midpoint offset (0, -30 - 10) maps to (40, 0).
    expectPointNear(rotateHandlePosition(p, 10.0f), Point2{ 90.0f, 30.0f });
}

TEST(GeometryTest, LabelAnchorIsShapeCentroid) {
    const Panel tri = makePanel(PanelShape::RightTriangle, 0.0f, 0.0f, 90.0f, 60.0f);
    expectPointNear(labelAnchor(tri), Point2{ 30.0f, 20.0f });

    const Panel rect = makePanel(PanelShape::Rectangle, 10.0f, 10.0f, 20.0f, 40.0f);
    expectPointNear(labelAnchor(rect), Point2{ 20.0f, 30.0f });
}
