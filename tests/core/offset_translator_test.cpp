/**
 * @file    offset_translator_test.cpp
 * @brief   Unit tests for preview-to-export offset translation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/offset_translator.hpp"

namespace pwt {

TEST(OffsetTranslatorTest, RatioIsFractionOfCanvas) {
    const RatioOffset ratio = to_ratio({90, -35}, {900, 700});
    EXPECT_DOUBLE_EQ(ratio.rx, 0.1);
    EXPECT_DOUBLE_EQ(ratio.ry, -0.05);
}

TEST(OffsetTranslatorTest, ZeroDimensionYieldsZeroRatio) {
    const RatioOffset ratio = to_ratio({25, 30}, {0, 0});
    EXPECT_DOUBLE_EQ(ratio.rx, 0.0);
    EXPECT_DOUBLE_EQ(ratio.ry, 0.0);
}

TEST(OffsetTranslatorTest, ScalesToLargerCanvasWithRounding) {
    // Dragged 16 px left on a 900 px preview, exported at 4000 px
    const RatioOffset ratio = to_ratio({-16, 0}, {900, 700});
    const PixelOffset pixels = to_pixels(ratio, {4000, 3111});
    EXPECT_EQ(pixels.dx, -71);
    EXPECT_EQ(pixels.dy, 0);
}

TEST(OffsetTranslatorTest, RoundTripOnSameCanvasIsExact) {
    const cv::Size canvas(900, 675);
    for (int d = -200; d <= 200; d += 7) {
        const PixelOffset original{d, -d / 2};
        EXPECT_EQ(to_pixels(to_ratio(original, canvas), canvas), original) << "d=" << d;
    }
}

TEST(OffsetTranslatorTest, ResolvePixelOffsetIsIdentity) {
    const PlacementOffset offset = PixelOffset{12, -4};
    EXPECT_EQ(resolve_offset(offset, {50, 50}), (PixelOffset{12, -4}));
    EXPECT_EQ(resolve_offset(offset, {5000, 5000}), (PixelOffset{12, -4}));
}

TEST(OffsetTranslatorTest, ResolveRatioOffsetFollowsCanvas) {
    const PlacementOffset offset = RatioOffset{0.25, -0.5};
    EXPECT_EQ(resolve_offset(offset, {400, 200}), (PixelOffset{100, -100}));
    EXPECT_EQ(resolve_offset(offset, {800, 400}), (PixelOffset{200, -200}));
}

TEST(OffsetTranslatorTest, CaptureKeepsExistingRatio) {
    const PlacementOffset offset = RatioOffset{0.3, 0.1};
    EXPECT_EQ(capture_ratio(offset, {123, 456}), (RatioOffset{0.3, 0.1}));
}

TEST(OffsetTranslatorTest, CaptureConvertsPixels) {
    const PlacementOffset offset = PixelOffset{45, 70};
    const RatioOffset ratio = capture_ratio(offset, {900, 700});
    EXPECT_DOUBLE_EQ(ratio.rx, 0.05);
    EXPECT_DOUBLE_EQ(ratio.ry, 0.1);
}

}  // namespace pwt
