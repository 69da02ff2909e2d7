/**
 * @file    layer_renderer_test.cpp
 * @brief   Unit tests for text/image layer rendering
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/layer_renderer.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgproc.hpp>

namespace pwt {

namespace {

TextWatermark make_text(const std::string& content, int size = 48, float opacity = 1.0f) {
    TextWatermark text;
    text.content = content;
    text.font_size = size;
    text.opacity = opacity;
    return text;
}

}  // anonymous namespace

class LayerRendererTest : public ::testing::Test {
protected:
    LayerRenderer renderer_;
    test::TempDir temp_;
};

// =============================================================================
// Text Tests
// =============================================================================

TEST_F(LayerRendererTest, EmptyTextYieldsTransparentPixel) {
    RenderedLayer layer = renderer_.render_text(make_text(""), 0);
    EXPECT_EQ(layer.size(), cv::Size(1, 1));
    EXPECT_TRUE(layer.is_blank());
}

TEST_F(LayerRendererTest, EmptyTextIgnoresRotation) {
    RenderedLayer layer = renderer_.render_text(make_text(""), 45);
    EXPECT_EQ(layer.size(), cv::Size(1, 1));
}

TEST_F(LayerRendererTest, TextLayerHasContent) {
    RenderedLayer layer = renderer_.render_text(make_text("Hello"), 0);
    EXPECT_GT(layer.width(), layer.height());
    EXPECT_FALSE(layer.is_blank());
    EXPECT_EQ(layer.pixels().type(), CV_8UC4);
}

TEST_F(LayerRendererTest, TextUsesRequestedColor) {
    TextWatermark text = make_text("W", 64);
    text.color = Rgb{255, 0, 0};
    RenderedLayer layer = renderer_.render_text(text, 0);

    cv::Mat alpha;
    cv::extractChannel(layer.pixels(), alpha, 3);
    cv::Point peak;
    cv::minMaxLoc(alpha, nullptr, nullptr, nullptr, &peak);

    const auto px = layer.pixels().at<cv::Vec4b>(peak);
    EXPECT_EQ(px[0], 0);    // B
    EXPECT_EQ(px[1], 0);    // G
    EXPECT_EQ(px[2], 255);  // R
}

TEST_F(LayerRendererTest, LargerFontGivesLargerLayer) {
    const cv::Size small = renderer_.measure_text(make_text("Sample", 20));
    const cv::Size large = renderer_.measure_text(make_text("Sample", 80));
    EXPECT_GT(large.width, small.width);
    EXPECT_GT(large.height, small.height);
}

TEST_F(LayerRendererTest, MultiLineTextGrowsHeight) {
    const cv::Size one = renderer_.measure_text(make_text("Line"));
    const cv::Size two = renderer_.measure_text(make_text("Line\nLine"));
    EXPECT_EQ(two.width, one.width);
    EXPECT_EQ(two.height, 2 * one.height);
}

TEST_F(LayerRendererTest, OpacityScalesAlphaMonotonically) {
    const double quarter = test::channel_sum(renderer_.render_text(make_text("Mark", 48, 0.25f), 0).pixels(), 3);
    const double half = test::channel_sum(renderer_.render_text(make_text("Mark", 48, 0.5f), 0).pixels(), 3);
    const double full = test::channel_sum(renderer_.render_text(make_text("Mark", 48, 1.0f), 0).pixels(), 3);

    EXPECT_LT(quarter, half);
    EXPECT_LT(half, full);
    EXPECT_DOUBLE_EQ(test::channel_max(renderer_.render_text(make_text("Mark", 48, 1.0f), 0).pixels(), 3), 255.0);
}

TEST_F(LayerRendererTest, ZeroOpacityIsBlank) {
    RenderedLayer layer = renderer_.render_text(make_text("Mark", 48, 0.0f), 0);
    EXPECT_TRUE(layer.is_blank());
}

TEST_F(LayerRendererTest, RenderClampsFontSize) {
    WatermarkSpec spec;
    spec.payload = make_text("X", 5000);
    RenderedLayer clamped = renderer_.render(spec, {100, 100});

    spec.payload = make_text("X", kMaxFontSize);
    RenderedLayer max_size = renderer_.render(spec, {100, 100});

    EXPECT_EQ(clamped.size(), max_size.size());
}

TEST_F(LayerRendererTest, FontMetricsAreCached) {
    (void)renderer_.font_metrics("sans", 32);
    (void)renderer_.font_metrics("sans", 32);
    EXPECT_EQ(renderer_.cached_font_count(), 1u);

    (void)renderer_.font_metrics("serif", 32);
    (void)renderer_.font_metrics("sans", 40);
    EXPECT_EQ(renderer_.cached_font_count(), 3u);

    renderer_.clear_cache();
    EXPECT_EQ(renderer_.cached_font_count(), 0u);
}

TEST_F(LayerRendererTest, FontFaceNames) {
    EXPECT_EQ(resolve_font_face("sans"), cv::FONT_HERSHEY_SIMPLEX);
    EXPECT_EQ(resolve_font_face("serif-bold"), cv::FONT_HERSHEY_TRIPLEX);
    EXPECT_EQ(resolve_font_face("serif-italic"), cv::FONT_HERSHEY_COMPLEX | cv::FONT_ITALIC);
    EXPECT_EQ(resolve_font_face("comic"), cv::FONT_HERSHEY_SIMPLEX);
}

TEST_F(LayerRendererTest, TallGlyphsAreNotClipped) {
    // Brackets and bars rise above the capital height
    for (const std::string content : {"(|)", "[c] {x}", "(c) 2024"}) {
        const TextWatermark text = make_text(content, 32);
        const FontMetrics& metrics = renderer_.font_metrics(text.font, text.font_size);

        cv::Mat reference(400, 800, CV_8UC1, cv::Scalar(0));
        cv::putText(reference, content, cv::Point(200, 200), metrics.face, metrics.scale,
                    cv::Scalar(255), metrics.thickness, cv::LINE_AA);

        RenderedLayer layer = renderer_.render_text(text, 0);
        EXPECT_EQ(test::channel_sum(layer.pixels(), 3), cv::sum(reference)[0]) << content;
    }
}

TEST_F(LayerRendererTest, LineBoxCoversBracketHeight) {
    const FontMetrics& metrics = renderer_.font_metrics("sans", 32);

    int baseline = 0;
    const cv::Size capital = cv::getTextSize("A", metrics.face, metrics.scale,
                                             metrics.thickness, &baseline);
    EXPECT_GT(metrics.ascent, capital.height);
    EXPECT_EQ(renderer_.measure_text(make_text("(|)", 32)).height, metrics.line_height());
}

TEST_F(LayerRendererTest, LayerIsCroppedToInkColumns) {
    const cv::Size plain = renderer_.measure_text(make_text("Mark", 40));
    EXPECT_EQ(renderer_.measure_text(make_text("Mark  ", 40)), plain);

    // Leading spaces move the ink by a fractional advance
    const cv::Size leading = renderer_.measure_text(make_text("  Mark", 40));
    EXPECT_NEAR(leading.width, plain.width, 1);
    EXPECT_EQ(leading.height, plain.height);

    RenderedLayer layer = renderer_.render_text(make_text("Mark", 40), 0);
    cv::Mat alpha;
    cv::extractChannel(layer.pixels(), alpha, 3);
    EXPECT_GT(cv::countNonZero(alpha.col(0)), 0);
    EXPECT_GT(cv::countNonZero(alpha.col(alpha.cols - 1)), 0);
}

TEST_F(LayerRendererTest, WhitespaceOnlyTextIsEmpty) {
    RenderedLayer layer = renderer_.render_text(make_text("   "), 0);
    EXPECT_EQ(layer.size(), cv::Size(1, 1));
    EXPECT_TRUE(layer.is_blank());
}

// =============================================================================
// Font File Tests
// =============================================================================

TEST_F(LayerRendererTest, FontFileDrawsNonAsciiText) {
    const auto font = test::find_system_font();
    if (!font) GTEST_SKIP() << "No TrueType font on this machine";

    TextWatermark text = make_text("\xC2\xA9 Ren\xC3\xA9", 40);
    text.font_file = *font;
    RenderedLayer layer = renderer_.render_text(text, 0);

    EXPECT_FALSE(layer.is_blank());
    EXPECT_GT(layer.width(), layer.height());
    EXPECT_DOUBLE_EQ(test::channel_max(layer.pixels(), 3), 255.0);
}

TEST_F(LayerRendererTest, FontFileMultiLineStacksAtLineHeight) {
    const auto font = test::find_system_font();
    if (!font) GTEST_SKIP() << "No TrueType font on this machine";

    TextWatermark one = make_text("Line", 40);
    one.font_file = *font;
    TextWatermark two = one;
    two.content = "Line\nLine";

    const int line_height = renderer_.truetype_font(*font, 40).line_height();
    EXPECT_EQ(renderer_.measure_text(two).height - renderer_.measure_text(one).height, line_height);
    EXPECT_EQ(renderer_.measure_text(two).width, renderer_.measure_text(one).width);
}

TEST_F(LayerRendererTest, FontFacesAreCachedByPathAndSize) {
    const auto font = test::find_system_font();
    if (!font) GTEST_SKIP() << "No TrueType font on this machine";

    TextWatermark text = make_text("Cache", 32);
    text.font_file = *font;
    (void)renderer_.render_text(text, 0);
    (void)renderer_.render_text(text, 30);
    EXPECT_EQ(renderer_.cached_face_count(), 1u);

    text.font_size = 48;
    (void)renderer_.render_text(text, 0);
    EXPECT_EQ(renderer_.cached_face_count(), 2u);

    renderer_.clear_cache();
    EXPECT_EQ(renderer_.cached_face_count(), 0u);
}

TEST_F(LayerRendererTest, MissingFontFileIsLoadFailure) {
    TextWatermark text = make_text("Mark");
    text.font_file = temp_ / "missing.ttf";

    try {
        (void)renderer_.render_text(text, 0);
        FAIL() << "Expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LoadFailure);
    }
}

TEST_F(LayerRendererTest, EmptyTextSkipsFontFile) {
    TextWatermark text = make_text("");
    text.font_file = temp_ / "missing.ttf";

    RenderedLayer layer = renderer_.render_text(text, 0);
    EXPECT_EQ(layer.size(), cv::Size(1, 1));
    EXPECT_EQ(renderer_.cached_face_count(), 0u);
}

// =============================================================================
// Rotation Tests
// =============================================================================

TEST_F(LayerRendererTest, ZeroRotationKeepsLayer) {
    const cv::Mat layer = test::solid_bgra(100, 60);
    const cv::Mat rotated = rotate_expand(layer, 0.0);
    EXPECT_EQ(rotated.size(), layer.size());
}

TEST_F(LayerRendererTest, RotationExpandsBoundingBox) {
    const cv::Mat layer = test::solid_bgra(100, 60);
    const cv::Mat rotated = rotate_expand(layer, 45.0);

    EXPECT_GT(rotated.cols, layer.cols);
    EXPECT_GT(rotated.rows, layer.rows);
    // ceil((100 + 60) * cos 45)
    EXPECT_EQ(rotated.size(), cv::Size(114, 114));
}

TEST_F(LayerRendererTest, RotationKeepsAllContent) {
    const cv::Mat layer = test::solid_bgra(100, 60);
    const cv::Mat rotated = rotate_expand(layer, 30.0);

    const double before = test::channel_sum(layer, 3);
    const double after = test::channel_sum(rotated, 3);
    EXPECT_NEAR(after, before, before * 0.03);

    // Corners of the expanded box lie outside the rotated rectangle
    EXPECT_EQ(rotated.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(rotated.at<cv::Vec4b>(rotated.rows - 1, rotated.cols - 1)[3], 0);
}

TEST_F(LayerRendererTest, QuarterTurnSwapsDimensions) {
    const cv::Mat rotated = rotate_expand(test::solid_bgra(100, 60), 90.0);
    EXPECT_EQ(rotated.size(), cv::Size(60, 100));
}

TEST_F(LayerRendererTest, RotatedTextLayerIsLarger) {
    const RenderedLayer flat = renderer_.render_text(make_text("Rotate me"), 0);
    const RenderedLayer tilted = renderer_.render_text(make_text("Rotate me"), 20);
    EXPECT_GT(tilted.height(), flat.height());
    EXPECT_FALSE(tilted.is_blank());
}

// =============================================================================
// Image Tests
// =============================================================================

TEST_F(LayerRendererTest, ImageScalesToCanvasWidth) {
    const auto logo = temp_ / "logo.png";
    test::write_png(logo, test::solid_bgra(200, 100));

    ImageWatermark image;
    image.source = logo;
    image.scale_percent = 25;

    RenderedLayer layer = renderer_.render_image(image, 400, 0);
    EXPECT_EQ(layer.size(), cv::Size(100, 50));

    image.scale_percent = 100;
    layer = renderer_.render_image(image, 400, 0);
    EXPECT_EQ(layer.size(), cv::Size(400, 200));
}

TEST_F(LayerRendererTest, ImageOpacityMultipliesAlpha) {
    const auto logo = temp_ / "logo.png";
    test::write_png(logo, test::solid_bgra(50, 50));

    ImageWatermark image;
    image.source = logo;
    image.scale_percent = 50;
    image.opacity = 0.5f;

    RenderedLayer layer = renderer_.render_image(image, 100, 0);
    EXPECT_NEAR(test::channel_max(layer.pixels(), 3), 128.0, 1.0);
}

TEST_F(LayerRendererTest, ImageBitmapIsCachedPerPath) {
    const auto logo = temp_ / "logo.png";
    test::write_png(logo, test::solid_bgra(20, 20));

    ImageWatermark image;
    image.source = logo;

    (void)renderer_.render_image(image, 100, 0);
    (void)renderer_.render_image(image, 300, 0);
    EXPECT_EQ(renderer_.cached_bitmap_count(), 1u);

    renderer_.forget(logo);
    EXPECT_EQ(renderer_.cached_bitmap_count(), 0u);
}

TEST_F(LayerRendererTest, MissingImageThrowsLoadFailure) {
    ImageWatermark image;
    image.source = temp_ / "missing.png";

    try {
        (void)renderer_.render_image(image, 100, 0);
        FAIL() << "Expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LoadFailure);
    }
}

TEST_F(LayerRendererTest, EmptyImagePathThrows) {
    WatermarkSpec spec;
    spec.payload = ImageWatermark{};
    EXPECT_THROW((void)renderer_.render(spec, {100, 100}), WatermarkError);
}

}  // namespace pwt
