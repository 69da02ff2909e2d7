/**
 * @file    geometry_test.cpp
 * @brief   Unit tests for placement geometry
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/geometry.hpp"

namespace pwt {

// =============================================================================
// Anchor Tests
// =============================================================================

struct AnchorCase {
    Anchor anchor;
    cv::Point expected;
};

class AnchorTest : public ::testing::TestWithParam<AnchorCase> {};

TEST_P(AnchorTest, ResolvesNineAnchors) {
    const cv::Size canvas(800, 600);
    const cv::Size layer(200, 50);

    EXPECT_EQ(resolve_anchor(canvas, layer, GetParam().anchor), GetParam().expected)
        << to_string(GetParam().anchor);
}

INSTANTIATE_TEST_SUITE_P(
    Grid, AnchorTest,
    ::testing::Values(
        AnchorCase{Anchor::TopLeft,      {16, 16}},
        AnchorCase{Anchor::TopCenter,    {300, 16}},
        AnchorCase{Anchor::TopRight,     {584, 16}},
        AnchorCase{Anchor::MiddleLeft,   {16, 275}},
        AnchorCase{Anchor::Center,       {300, 275}},
        AnchorCase{Anchor::MiddleRight,  {584, 275}},
        AnchorCase{Anchor::BottomLeft,   {16, 534}},
        AnchorCase{Anchor::BottomCenter, {300, 534}},
        AnchorCase{Anchor::BottomRight,  {584, 534}}
    ));

TEST(GeometryTest, CenterUsesFloorDivision) {
    EXPECT_EQ(resolve_anchor({101, 101}, {10, 10}, Anchor::Center), cv::Point(45, 45));
    // Layer wider than canvas: (100 - 105) / 2 floors to -3
    EXPECT_EQ(resolve_anchor({100, 100}, {105, 105}, Anchor::Center), cv::Point(-3, -3));
}

TEST(GeometryTest, OversizedLayerGoesNegative) {
    const auto pos = resolve_anchor({100, 100}, {300, 300}, Anchor::BottomRight);
    EXPECT_EQ(pos, cv::Point(-216, -216));
}

TEST(GeometryTest, OffsetIsAddedToAnchor) {
    const auto pos = resolve_position({800, 600}, {200, 50}, Anchor::BottomRight, {-10, 20});
    EXPECT_EQ(pos, cv::Point(574, 554));
}

TEST(GeometryTest, ParseAnchorNames) {
    EXPECT_EQ(parse_anchor("top-left"), Anchor::TopLeft);
    EXPECT_EQ(parse_anchor("center"), Anchor::Center);
    EXPECT_EQ(parse_anchor("middle-right"), Anchor::MiddleRight);
    EXPECT_EQ(parse_anchor("nowhere"), Anchor::BottomRight);
}

// =============================================================================
// Preview Fit Tests
// =============================================================================

TEST(GeometryTest, FitScaleDownscalesLargeImage) {
    const PreviewLimits limits{900, 700};
    EXPECT_DOUBLE_EQ(fit_scale({4000, 3000}, limits), 0.225);
    EXPECT_EQ(fit_within({4000, 3000}, limits), cv::Size(900, 675));
}

TEST(GeometryTest, FitScaleLimitedByHeight) {
    const PreviewLimits limits{900, 700};
    EXPECT_EQ(fit_within({1000, 1400}, limits), cv::Size(500, 700));
}

TEST(GeometryTest, FitNeverUpscales) {
    const PreviewLimits limits{900, 700};
    EXPECT_DOUBLE_EQ(fit_scale({640, 480}, limits), 1.0);
    EXPECT_EQ(fit_within({640, 480}, limits), cv::Size(640, 480));
}

TEST(GeometryTest, FitKeepsOnePixelMinimum) {
    EXPECT_EQ(fit_within({10000, 1}, PreviewLimits{100, 100}), cv::Size(100, 1));
}

// =============================================================================
// Resize Target Tests
// =============================================================================

TEST(GeometryTest, ResizeToWidthKeepsAspect) {
    EXPECT_EQ(resize_target({1000, 500}, {ResizeMode::Width, 500}), cv::Size(500, 250));
}

TEST(GeometryTest, ResizeToHeightKeepsAspect) {
    EXPECT_EQ(resize_target({1000, 500}, {ResizeMode::Height, 100}), cv::Size(200, 100));
}

TEST(GeometryTest, ResizeByPercent) {
    EXPECT_EQ(resize_target({1000, 500}, {ResizeMode::Percent, 50}), cv::Size(500, 250));
    EXPECT_EQ(resize_target({1000, 500}, {ResizeMode::Percent, 200}), cv::Size(2000, 1000));
}

TEST(GeometryTest, ResizeRejectsNonPositiveValue) {
    EXPECT_THROW((void)resize_target({1000, 500}, {ResizeMode::Width, 0}), WatermarkError);
    EXPECT_THROW((void)resize_target({1000, 500}, {ResizeMode::Percent, -5}), WatermarkError);
}

}  // namespace pwt
