#pragma once

#include <gtest/gtest.h>
#include "geoliner/engine.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"
#include "tests/test_accessors.h"
#include <cmath>
#include <string>
#include <vector>

namespace geoliner_test {
using namespace geoliner;

inline constexpr float kEps = 1e-3f;
inline constexpr float kViewWidth = 800.0f;
inline constexpr float kViewHeight = 600.0f;
inline constexpr std::uint32_t kNoModifiers = 0;
inline constexpr std::uint32_t kShift = static_cast<std::uint32_t>(Modifier::Shift);
inline constexpr std::uint32_t kCtrl = static_cast<std::uint32_t>(Modifier::Ctrl);

// Adds a rectangle and moves it to (x, y); returns its id.
inline std::uint32_t placeRect(LayoutEngine& engine, float x, float y, float w, float l, const std::string& panelNumber = "P-001") {
    const std::uint32_t id = engine.addRectangle("R-102", panelNumber, w, l);
    PanelPatch patch;
    patch.x = x;
    patch.y = y;
    engine.updatePanel(id, patch);
    return id;
}

inline void dragScreen(LayoutEngine& engine, float fromX, float fromY, float toX, float toY, std::uint32_t modifiers = kNoModifiers) {
    engine.pointerDown(fromX, fromY, modifiers);
    engine.pointerMove(toX, toY, modifiers);
    engine.pointerUp(toX, toY, modifiers);
}

inline void clickScreen(LayoutEngine& engine, float x, float y, std::uint32_t modifiers = kNoModifiers) {
    engine.pointerDown(x, y, modifiers);
    engine.pointerUp(x, y, modifiers);
}

inline Panel makePanel(PanelShape shape, float x, float y, float w, float l, float rotation = 0.0f) {
    Panel p;
    p.id = 1;
    p.rollNumber = "R-1";
    p.panelNumber = "P-1";
    p.shape = shape;
    p.x = x;
    p.y = y;
    p.width = w;
    p.length = l;
    p.rotation = rotation;
    return p;
}

inline Panel makePolygon(const std::vector<Point2>& corners) {
    Panel p;
    p.id = 1;
    p.rollNumber = "R-1";
    p.panelNumber = "P-1";
    p.shape = PanelShape::Polygon;
    p.corners = corners;
    syncPolygonFrame(p);
    return p;
}

inline void expectPointNear(Point2 actual, Point2 expected, float eps = kEps) {
    EXPECT_NEAR(actual.x, expected.x, eps);
    EXPECT_NEAR(actual.y, expected.y, eps);
}

} // namespace geoliner_test

// Screen == world at scale 1 with no pan, which keeps scenarios readable.
class LayoutEngineTest : public ::testing::Test {
protected:
    geoliner::LayoutEngine engine;

    void SetUp() override {
        engine.clear();
        engine.setViewSize(geoliner_test::kViewWidth, geoliner_test::kViewHeight);
    }

    const geoliner::Panel& panel(std::uint32_t id) {
        const geoliner::Panel* p = engine.getPanel(id);
        EXPECT_NE(p, nullptr);
        static const geoliner::Panel kMissing{};
        return p ? *p : kMissing;
    }
};
