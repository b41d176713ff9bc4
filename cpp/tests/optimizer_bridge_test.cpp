#include "tests/engine_test_common.h"
#include "geoliner/service/export_sink.h"
#include "geoliner/service/optimizer_bridge.h"

#include <stdexcept>
#include <vector>

using namespace geoliner_test;

namespace {

class FakeOptimizer : public OptimizerClient {
public:
    OptimizerReply reply;
    bool throwOnCall = false;
    int calls = 0;
    OptimizerRequest lastRequest;

    OptimizerReply optimize(const OptimizerRequest& request) override {
        ++calls;
        lastRequest = request;
        if (throwOnCall) {
            throw std::runtime_error("optimizer unreachable");
        }
        return reply;
    }
};

class RecordingSink : public ExportSink {
public:
    bool accept = true;
    bool throwOnCall = false;
    std::vector<Panel> received;
    SiteConfig site;

    bool exportPanels(const std::vector<Panel>& panels, const SiteConfig& config) override {
        if (throwOnCall) {
            throw std::runtime_error("disk full");
        }
        received = panels;
        site = config;
        return accept;
    }
};

OptimizerReply passReply(std::vector<PanelPlacement> placements) {
    OptimizerReply reply;
    reply.status = OptimizerStatus::Pass;
    reply.placements = std::move(placements);
    reply.summary.message = "ok";
    return reply;
}

} // namespace

TEST(OptimizerStrategyTest, NamesRoundTrip) {
    for (OptimizerStrategy s : { OptimizerStrategy::Balanced, OptimizerStrategy::Material, OptimizerStrategy::Labor }) {
        const auto parsed = parseOptimizerStrategy(optimizerStrategyName(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parseOptimizerStrategy("fastest").has_value());
    EXPECT_FALSE(parseOptimizerStrategy("").has_value());
}

TEST_F(LayoutEngineTest, OptimizerRequestCarriesSiteAndPanels) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;
    optimizer.reply = passReply({});

    const OptimizerOutcome outcome = engine.runOptimizer(optimizer, OptimizerStrategy::Material);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(optimizer.calls, 1);
    EXPECT_EQ(optimizer.lastRequest.strategy, OptimizerStrategy::Material);
    EXPECT_FLOAT_EQ(optimizer.lastRequest.site.width, 1000.0f);
    ASSERT_EQ(optimizer.lastRequest.panels.size(), 1u);
    EXPECT_EQ(optimizer.lastRequest.panels[0].id, a);
    EXPECT_EQ(optimizer.lastRequest.panels[0].rollNumber, "R-102");
}

TEST_F(LayoutEngineTest, OptimizerRequestCarriesPolygonCorners) {
    const std::vector<Point2> corners{ { 100.0f, 100.0f }, { 160.0f, 100.0f }, { 130.0f, 150.0f } };
    const std::uint32_t id = engine.addPanel(PolygonSpec{ PanelLabels{ "R-7", "P-7" }, corners });
    ASSERT_NE(id, 0u);
    FakeOptimizer optimizer;
    optimizer.reply = passReply({});

    ASSERT_TRUE(engine.runOptimizer(optimizer, OptimizerStrategy::Balanced).ok());
    ASSERT_EQ(optimizer.lastRequest.panels.size(), 1u);
    const Panel& sent = optimizer.lastRequest.panels[0];
    EXPECT_EQ(sent.shape, PanelShape::Polygon);
    ASSERT_EQ(sent.corners.size(), 3u);
    expectPointNear(sent.corners[2], Point2{ 130.0f, 150.0f });
}

TEST_F(LayoutEngineTest, OptimizerPlacementsApplyTogether) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 100.0f, 100.0f, "P-001");
    const std::uint32_t b = placeRect(engine, 300.0f, 300.0f, 100.0f, 100.0f, "P-002");
    FakeOptimizer optimizer;
    optimizer.reply = passReply({ PanelPlacement{ a, 0.0f, 0.0f, 0.0f }, PanelPlacement{ b, 100.0f, 0.0f, 90.0f } });

    const std::uint32_t gen = engine.getGeneration();
    const OptimizerOutcome outcome = engine.runOptimizer(optimizer, OptimizerStrategy::Balanced);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_EQ(engine.getGeneration(), gen + 1);

    EXPECT_FLOAT_EQ(panel(a).x, 0.0f);
    EXPECT_FLOAT_EQ(panel(b).x, 100.0f);
    EXPECT_FLOAT_EQ(panel(b).rotation, 90.0f);
    EXPECT_EQ(outcome.summary.totalPanels, 2u);
    EXPECT_EQ(outcome.summary.strategy, OptimizerStrategy::Balanced);
    // Two 100 x 100 panels on a 1000 x 1000 site.
    EXPECT_NEAR(outcome.summary.siteUtilization, 2.0f, kEps);
    EXPECT_EQ(outcome.message, "ok");
}

TEST_F(LayoutEngineTest, OptimizerPlacementsAreClamped) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;
    optimizer.reply = passReply({ PanelPlacement{ a, 5000.0f, -20.0f, 450.0f } });

    ASSERT_TRUE(engine.runOptimizer(optimizer, OptimizerStrategy::Labor).ok());
    EXPECT_NEAR(panel(a).rotation, 90.0f, kEps);
    const AABB f = panelFootprint(panel(a));
    EXPECT_NEAR(f.maxX, 1000.0f, kEps);
    EXPECT_NEAR(f.minY, 0.0f, kEps);
}

TEST_F(LayoutEngineTest, OptimizerRejectsUnknownPanel) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;
    optimizer.reply = passReply({ PanelPlacement{ a, 0.0f, 0.0f, 0.0f }, PanelPlacement{ 77, 0.0f, 0.0f, 0.0f } });

    const OptimizerOutcome outcome = engine.runOptimizer(optimizer, OptimizerStrategy::Balanced);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, EngineError::OptimizerFailed);
    EXPECT_EQ(engine.getLastError(), EngineError::OptimizerFailed);
    EXPECT_FLOAT_EQ(panel(a).x, 100.0f);
}

TEST_F(LayoutEngineTest, OptimizerRejectsDuplicateAndNonFinitePlacements) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;

    optimizer.reply = passReply({ PanelPlacement{ a, 0.0f, 0.0f, 0.0f }, PanelPlacement{ a, 10.0f, 0.0f, 0.0f } });
    EXPECT_EQ(engine.runOptimizer(optimizer, OptimizerStrategy::Balanced).error, EngineError::OptimizerFailed);

    optimizer.reply = passReply({ PanelPlacement{ a, NAN, 0.0f, 0.0f } });
    EXPECT_EQ(engine.runOptimizer(optimizer, OptimizerStrategy::Balanced).error, EngineError::OptimizerFailed);

    optimizer.reply = passReply({ PanelPlacement{ a, 0.0f, 0.0f, INFINITY } });
    EXPECT_EQ(engine.runOptimizer(optimizer, OptimizerStrategy::Balanced).error, EngineError::OptimizerFailed);

    EXPECT_FLOAT_EQ(panel(a).x, 100.0f);
    EXPECT_FLOAT_EQ(panel(a).rotation, 0.0f);
}

TEST_F(LayoutEngineTest, OptimizerFailStatusLeavesLayout) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;
    optimizer.reply = passReply({ PanelPlacement{ a, 0.0f, 0.0f, 0.0f } });
    optimizer.reply.status = OptimizerStatus::Fail;
    optimizer.reply.errorMessage = "no feasible layout";

    const OptimizerOutcome outcome = engine.runOptimizer(optimizer, OptimizerStrategy::Balanced);
    EXPECT_EQ(outcome.error, EngineError::OptimizerFailed);
    EXPECT_EQ(outcome.message, "no feasible layout");
    EXPECT_FLOAT_EQ(panel(a).x, 100.0f);
}

TEST_F(LayoutEngineTest, OptimizerExceptionIsReported) {
    const std::uint32_t a = placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    FakeOptimizer optimizer;
    optimizer.throwOnCall = true;

    const OptimizerOutcome outcome = engine.runOptimizer(optimizer, OptimizerStrategy::Balanced);
    EXPECT_EQ(outcome.error, EngineError::OptimizerFailed);
    EXPECT_EQ(outcome.message, "optimizer unreachable");
    EXPECT_FLOAT_EQ(panel(a).x, 100.0f);
}

TEST_F(LayoutEngineTest, OptimizerEndsActiveGesture) {
    placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    engine.pointerDown(110.0f, 110.0f, kNoModifiers);
    ASSERT_EQ(engine.getInteractionMode(), InteractionMode::Dragging);

    FakeOptimizer optimizer;
    optimizer.reply = passReply({});
    engine.runOptimizer(optimizer, OptimizerStrategy::Balanced);
    EXPECT_EQ(engine.getInteractionMode(), InteractionMode::Idle);
}

TEST(SiteUtilizationTest, SumsShapeAreas) {
    PanelStore store;
    store.addPanel(RectangleSpec{ PanelLabels{ "R", "P1" }, 100.0f, 50.0f });
    store.addPanel(RightTriangleSpec{ PanelLabels{ "R", "P2" }, 100.0f, 100.0f });
    // (5000 + 5000) / 1000000
    EXPECT_NEAR(siteUtilizationPercent(store), 1.0f, kEps);
}

TEST_F(LayoutEngineTest, ExportHandsPanelsToSink) {
    placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f, "P-001");
    placeRect(engine, 300.0f, 100.0f, 40.0f, 20.0f, "P-002");
    RecordingSink sink;

    ASSERT_TRUE(engine.exportPanels(sink));
    ASSERT_EQ(sink.received.size(), 2u);
    EXPECT_EQ(sink.received[1].panelNumber, "P-002");
    EXPECT_EQ(sink.site.units, "ft");
}

TEST_F(LayoutEngineTest, ExportFailuresAreReported) {
    placeRect(engine, 100.0f, 100.0f, 40.0f, 20.0f);
    RecordingSink sink;

    sink.accept = false;
    EXPECT_FALSE(engine.exportPanels(sink));
    EXPECT_EQ(engine.getLastError(), EngineError::ExportFailed);

    sink.accept = true;
    sink.throwOnCall = true;
    EXPECT_FALSE(engine.exportPanels(sink));
    EXPECT_EQ(engine.getLastError(), EngineError::ExportFailed);

    sink.throwOnCall = false;
    EXPECT_TRUE(engine.exportPanels(sink));
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}
