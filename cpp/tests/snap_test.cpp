#include "tests/engine_test_common.h"
#include "geoliner/interaction/snap_solver.h"

using namespace geoliner_test;

namespace {

SnapOptions edgeOnly(float threshold) {
    SnapOptions options;
    options.gridEnabled = false;
    options.edgeEnabled = true;
    options.edgeThreshold = threshold;
    return options;
}

Panel withId(Panel p, std::uint32_t id) {
    p.id = id;
    return p;
}

const AABB kSpan{ 0.0f, 0.0f, 1000.0f, 1000.0f };

} // namespace

TEST(SnapTest, GridSnapRoundsToNearestMultiple) {
    EXPECT_FLOAT_EQ(snapToGrid(149.9f, 10.0f), 150.0f);
    EXPECT_FLOAT_EQ(snapToGrid(144.9f, 10.0f), 140.0f);
    EXPECT_FLOAT_EQ(snapToGrid(-6.0f, 10.0f), -10.0f);
    EXPECT_FLOAT_EQ(snapToGrid(3.3f, 0.5f), 3.5f);
}

TEST(SnapTest, GridSnapIsIdempotent) {
    for (float v : { -37.2f, 0.0f, 4.99f, 5.01f, 123.45f, 999.9f }) {
        const float once = snapToGrid(v, 10.0f);
        EXPECT_FLOAT_EQ(snapToGrid(once, 10.0f), once) << v;
    }
}

TEST(SnapTest, NonPositiveGridIsIdentity) {
    EXPECT_FLOAT_EQ(snapToGrid(12.34f, 0.0f), 12.34f);
    EXPECT_FLOAT_EQ(snapToGrid(12.34f, -5.0f), 12.34f);
    EXPECT_FLOAT_EQ(snapToGrid(12.34f, NAN), 12.34f);
    EXPECT_TRUE(std::isnan(snapToGrid(NAN, 10.0f)));
}

TEST(SnapTest, OptionsFollowSiteConfig) {
    SiteConfig site;
    SnapOptions o = snapOptionsFromSite(site);
    EXPECT_TRUE(o.gridEnabled);
    EXPECT_TRUE(o.edgeEnabled);
    EXPECT_FLOAT_EQ(o.edgeThreshold, 0.5f);

    site.gridSize = 0.0f;
    o = snapOptionsFromSite(site);
    EXPECT_FALSE(o.gridEnabled);
    EXPECT_TRUE(o.edgeEnabled);

    site.snapEnabled = false;
    site.gridSize = 10.0f;
    o = snapOptionsFromSite(site);
    EXPECT_FALSE(o.gridEnabled);
    EXPECT_FALSE(o.edgeEnabled);
}

TEST(SnapTest, EdgeSnapPicksClosestEdgePerAxis) {
    const std::vector<Panel> panels = {
        withId(makePanel(PanelShape::Rectangle, 100.0f, 100.0f, 50.0f, 50.0f), 1),  // maxX 150
        withId(makePanel(PanelShape::Rectangle, 400.0f, 400.0f, 10.0f, 10.0f), 2),
        withId(makePanel(PanelShape::Rectangle, 150.3f, 600.0f, 10.0f, 10.0f), 3),  // minX 150.3
    };
    // Moving minX 150.2: 0.2 from panel 1's maxX, 0.1 from panel 3's minX.
    const AABB moving{ 150.2f, 300.0f, 180.2f, 330.0f };
    std::vector<SnapGuide> guides;
    const SnapResult r = computeEdgeSnap(edgeOnly(0.5f), 99, moving, panels, kSpan, guides);

    ASSERT_TRUE(r.snappedX);
    EXPECT_FALSE(r.snappedY);
    EXPECT_EQ(r.targetX, 3u);
    EXPECT_NEAR(r.dx, 0.1f, kEps);
    ASSERT_EQ(guides.size(), 1u);
    EXPECT_NEAR(guides[0].x0, 150.3f, kEps);
    EXPECT_FLOAT_EQ(guides[0].y0, kSpan.minY);
    EXPECT_FLOAT_EQ(guides[0].y1, kSpan.maxY);
}

TEST(SnapTest, EdgeSnapAxesAreIndependent) {
    const std::vector<Panel> panels = {
        withId(makePanel(PanelShape::Rectangle, 100.0f, 100.0f, 50.0f, 50.0f), 1),
        withId(makePanel(PanelShape::Rectangle, 500.0f, 200.0f, 50.0f, 50.0f), 2),
    };
    const AABB moving{ 150.2f, 250.4f, 180.2f, 280.4f };
    std::vector<SnapGuide> guides;
    const SnapResult r = computeEdgeSnap(edgeOnly(0.5f), 99, moving, panels, kSpan, guides);

    EXPECT_TRUE(r.snappedX);
    EXPECT_TRUE(r.snappedY);
    EXPECT_EQ(r.targetX, 1u);
    EXPECT_EQ(r.targetY, 2u);
    EXPECT_NEAR(r.dx, -0.2f, kEps);
    EXPECT_NEAR(r.dy, -0.4f, kEps);
    EXPECT_EQ(guides.size(), 2u);
}

TEST(SnapTest, EdgeSnapSkipsSelfAndDegenerateShapes) {
    const std::vector<Panel> panels = {
        withId(makePanel(PanelShape::Rectangle, 150.1f, 0.0f, 20.0f, 20.0f), 7),   // the moving panel
        withId(makePanel(PanelShape::RightTriangle, 150.2f, 0.0f, 0.0f, 20.0f), 8), // zero area
    };
    const AABB moving{ 150.0f, 500.0f, 170.0f, 520.0f };
    std::vector<SnapGuide> guides{ SnapGuide{} };
    const SnapResult r = computeEdgeSnap(edgeOnly(0.5f), 7, moving, panels, kSpan, guides);

    EXPECT_FALSE(r.snappedX);
    EXPECT_FALSE(r.snappedY);
    EXPECT_TRUE(guides.empty());
}

TEST(SnapTest, EdgeSnapRespectsThreshold) {
    const std::vector<Panel> panels = {
        withId(makePanel(PanelShape::Rectangle, 100.0f, 100.0f, 50.0f, 50.0f), 1),
    };
    std::vector<SnapGuide> guides;
    const SnapResult far = computeEdgeSnap(edgeOnly(0.2f), 2, AABB{ 150.3f, 400.0f, 170.3f, 420.0f }, panels, kSpan, guides);
    EXPECT_FALSE(far.snappedX);

    SnapOptions off = edgeOnly(0.2f);
    off.edgeEnabled = false;
    const SnapResult disabled = computeEdgeSnap(off, 2, AABB{ 150.1f, 400.0f, 170.1f, 420.0f }, panels, kSpan, guides);
    EXPECT_FALSE(disabled.snappedX);
}

TEST(SnapTest, EdgeSnapUsesRotatedFootprint) {
    // 100 x 20 rotated 90 covers x 40..60.
    const std::vector<Panel> panels = {
        withId(makePanel(PanelShape::Rectangle, 0.0f, 0.0f, 100.0f, 20.0f, 90.0f), 1),
    };
    std::vector<SnapGuide> guides;
    const SnapResult r = computeEdgeSnap(edgeOnly(0.5f), 2, AABB{ 60.3f, 500.0f, 80.3f, 520.0f }, panels, kSpan, guides);
    ASSERT_TRUE(r.snappedX);
    EXPECT_NEAR(r.dx, -0.3f, kEps);
}

TEST(SnapTest, DragSnapEdgeOverridesGridPerAxis) {
    SnapOptions options = edgeOnly(0.5f);
    options.gridEnabled = true;
    options.gridSize = 10.0f;

    const Panel other = withId(makePanel(PanelShape::Rectangle, 100.0f, 100.0f, 50.3f, 50.0f), 1);
    const Panel moving = withId(makePanel(PanelShape::Rectangle, 300.0f, 300.0f, 30.0f, 30.0f), 2);
    const std::vector<Panel> panels = { other, moving };

    std::vector<SnapGuide> guides;
    const Point2 out = solveDragSnap(options, moving, Point2{ 150.1f, 321.0f }, panels, kSpan, guides);
    // x: grid says 150, neighbor edge 150.3 wins. y: grid only.
    EXPECT_NEAR(out.x, 150.3f, kEps);
    EXPECT_NEAR(out.y, 320.0f, kEps);
    EXPECT_EQ(guides.size(), 1u);
}

TEST(SnapTest, DragSnapMovesPolygonProbe) {
    SnapOptions options = edgeOnly(0.5f);
    const Panel other = withId(makePanel(PanelShape::Rectangle, 100.0f, 100.0f, 50.0f, 50.0f), 1);
    Panel poly = makePolygon({ {300.0f, 300.0f}, {340.0f, 300.0f}, {320.0f, 330.0f} });
    poly.id = 2;

    std::vector<SnapGuide> guides;
    const Point2 out = solveDragSnap(options, poly, Point2{ 109.8f, 600.0f }, { other, poly }, kSpan, guides);
    // Probe spans x 109.8..149.8; its right edge meets 150.
    EXPECT_NEAR(out.x, 110.0f, kEps);
    EXPECT_NEAR(out.y, 600.0f, kEps);
}
