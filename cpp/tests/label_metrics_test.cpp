#include <gtest/gtest.h>
#include "geoliner/text/label_metrics.h"
#include "tests/engine_test_common.h"

#include <string>
#include <vector>

using geoliner::text::LabelMetrics;

TEST(LabelMetricsTest, UnavailableWithoutFont) {
    LabelMetrics metrics;
    EXPECT_FALSE(metrics.isAvailable());
    EXPECT_FALSE(metrics.measureWidth("P-001", 12.0f).has_value());

    metrics.initialize();
    EXPECT_FALSE(metrics.isAvailable());
    EXPECT_FALSE(metrics.loadFontFromMemory(nullptr, 0));
    EXPECT_FALSE(metrics.loadFontFromFile("/nonexistent/font.ttf"));
    EXPECT_FALSE(metrics.measureWidth("P-001", 12.0f).has_value());
}

TEST_F(LayoutEngineTest, LabelsKeepZoomSizeWithoutMetrics) {
    geoliner_test::placeRect(engine, 100.0f, 100.0f, 2.0f, 2.0f);
    EXPECT_FALSE(engine.hasLabelMetrics());
    for (const auto& c : engine.render().commands) {
        if (c.layer == geoliner::render::Layer::Label) {
            EXPECT_FLOAT_EQ(c.fontSize, 12.0f);
        }
    }
}

#if GEOLINER_TEXT_ENABLED

class LabelMetricsFontTest : public ::testing::Test {
protected:
    LabelMetrics metrics;
    bool fontLoaded = false;

    void SetUp() override {
        ASSERT_TRUE(metrics.initialize());
        const std::vector<std::string> fontPaths = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
            "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        };
        for (const std::string& path : fontPaths) {
            if (metrics.loadFontFromFile(path)) {
                fontLoaded = true;
                break;
            }
        }
    }

    void TearDown() override {
        metrics.shutdown();
    }
};

TEST_F(LabelMetricsFontTest, MeasuresPositiveWidth) {
    if (!fontLoaded) GTEST_SKIP() << "no system font available";
    const auto w = metrics.measureWidth("R-102", 12.0f);
    ASSERT_TRUE(w.has_value());
    EXPECT_GT(*w, 0.0f);
    EXPECT_LT(*w, 12.0f * 5.0f);
}

TEST_F(LabelMetricsFontTest, WidthScalesLinearlyWithSize) {
    if (!fontLoaded) GTEST_SKIP() << "no system font available";
    const auto small = metrics.measureWidth("15' x 100'", 6.0f);
    const auto large = metrics.measureWidth("15' x 100'", 12.0f);
    ASSERT_TRUE(small && large);
    EXPECT_NEAR(*large, *small * 2.0f, 1e-3f);
}

TEST_F(LabelMetricsFontTest, LongerTextIsWider) {
    if (!fontLoaded) GTEST_SKIP() << "no system font available";
    EXPECT_GT(*metrics.measureWidth("P-0001", 10.0f), *metrics.measureWidth("P-1", 10.0f));
    EXPECT_FLOAT_EQ(*metrics.measureWidth("", 10.0f), 0.0f);
    EXPECT_FALSE(metrics.measureWidth("P-1", 0.0f).has_value());
}

TEST_F(LayoutEngineTest, LabelsShrinkToFitSmallPanels) {
    const std::vector<std::string> fontPaths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    };
    bool loaded = false;
    for (const std::string& path : fontPaths) {
        if (engine.loadLabelFontFile(path)) {
            loaded = true;
            break;
        }
    }
    if (!loaded) GTEST_SKIP() << "no system font available";
    ASSERT_TRUE(engine.hasLabelMetrics());

    geoliner_test::placeRect(engine, 100.0f, 100.0f, 10.0f, 40.0f);
    for (const auto& c : engine.render().commands) {
        if (c.layer == geoliner::render::Layer::Label) {
            // Never above 0.3 of the smaller side.
            EXPECT_LE(c.fontSize, 3.0f + 1e-4f);
        }
    }
}

#endif
