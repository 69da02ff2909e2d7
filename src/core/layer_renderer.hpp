/**
 * @file    layer_renderer.hpp
 * @brief   Watermark layer rendering (text / image)
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Renders one watermark instance into its own transparent BGRA layer,
 * independent of the photo it will be composited onto.
 *
 * Text:  drawn anti-aliased with OpenCV Hershey fonts (ASCII), or with a
 *        TrueType font file through FreeType when one is set. The layer
 *        holds every glyph's ink: Hershey lines use a line box spanning
 *        the tallest and deepest printable glyphs.
 *        Alpha = glyph coverage * opacity, applied at render time.
 * Image: decoded once per path, scaled to a percentage of the canvas
 *        width, alpha multiplied by opacity.
 * Both:  optional rotation about the layer centre into an expanded
 *        bounding box (bicubic, premultiplied).
 *
 * Degenerate input (empty text) yields a 1x1 transparent layer.
 */

#pragma once

#include "core/truetype_font.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pwt {

/**
 * A rendered watermark layer (CV_8UC4, straight alpha)
 *
 * Move-only: each render produces a fresh layer that is handed to exactly
 * one compose call.
 */
class RenderedLayer {
public:
    RenderedLayer() = default;
    explicit RenderedLayer(cv::Mat pixels) : m_pixels(std::move(pixels)) {}

    RenderedLayer(const RenderedLayer&) = delete;
    RenderedLayer& operator=(const RenderedLayer&) = delete;
    RenderedLayer(RenderedLayer&&) noexcept = default;
    RenderedLayer& operator=(RenderedLayer&&) noexcept = default;

    [[nodiscard]] const cv::Mat& pixels() const noexcept { return m_pixels; }
    [[nodiscard]] int width() const noexcept { return m_pixels.cols; }
    [[nodiscard]] int height() const noexcept { return m_pixels.rows; }
    [[nodiscard]] cv::Size size() const noexcept { return m_pixels.size(); }

    /**
     * True when no pixel has any coverage
     */
    [[nodiscard]] bool is_blank() const;

private:
    cv::Mat m_pixels;
};

/**
 * Resolved font parameters for a (font name, pixel size) pair
 */
struct FontMetrics {
    int face{0};            // cv::HersheyFonts value (may include FONT_ITALIC)
    double scale{1.0};      // Scale giving the requested pixel height
    int thickness{1};       // Stroke thickness
    int ascent{0};          // Baseline distance from line top (tallest glyph)
    int descent{0};         // Below-baseline extent (deepest glyph)
    [[nodiscard]] int line_height() const noexcept { return ascent + descent; }
};

/**
 * Map a font family name to a Hershey face
 *
 * Names: sans, sans-bold, serif, serif-bold, script, plain, each with an
 * optional "-italic" suffix. Unknown names fall back to sans.
 */
[[nodiscard]] int resolve_font_face(const std::string& font);

/**
 * Rotate about the centre, expanding the canvas to hold all corners
 *
 * @param bgra     CV_8UC4 layer
 * @param degrees  Counter-clockwise angle
 * @return         New layer; input returned as-is for 0 degrees
 */
[[nodiscard]] cv::Mat rotate_expand(const cv::Mat& bgra, double degrees);

/**
 * Multiply the alpha channel in place by opacity (clamped to [0, 1])
 */
void multiply_alpha(cv::Mat& bgra, float opacity);

class LayerRenderer {
public:
    LayerRenderer() = default;

    // Owns caches; pass by reference
    LayerRenderer(const LayerRenderer&) = delete;
    LayerRenderer& operator=(const LayerRenderer&) = delete;

    /**
     * Render the spec's payload for a given canvas
     *
     * @param spec    Watermark description (clamped copy is used)
     * @param canvas  Size of the base image the layer is meant for
     * @throws WatermarkError(LoadFailure) if an image watermark is unreadable
     */
    [[nodiscard]] RenderedLayer render(const WatermarkSpec& spec, cv::Size canvas);

    [[nodiscard]] RenderedLayer render_text(const TextWatermark& text, int rotation_degrees);

    [[nodiscard]] RenderedLayer render_image(const ImageWatermark& image,
                                             int canvas_width,
                                             int rotation_degrees);

    /**
     * Size of the unrotated text block; empty for text without ink
     */
    [[nodiscard]] cv::Size measure_text(const TextWatermark& text);

    /**
     * Font metrics, cached by (font name, pixel size)
     */
    [[nodiscard]] const FontMetrics& font_metrics(const std::string& font, int pixel_size);

    /**
     * Font file loaded at a pixel size, cached by (path, pixel size)
     * @throws WatermarkError(LoadFailure)
     */
    [[nodiscard]] TrueTypeFont& truetype_font(const std::filesystem::path& path, int pixel_size);

    /**
     * Decoded watermark bitmap (BGRA), cached by path
     * @throws WatermarkError(LoadFailure)
     */
    [[nodiscard]] const cv::Mat& watermark_bitmap(const std::filesystem::path& path);

    /**
     * Drop a cached watermark bitmap (after the user reselects the file)
     */
    void forget(const std::filesystem::path& path);

    void clear_cache();

    [[nodiscard]] size_t cached_font_count() const noexcept { return m_fonts.size(); }
    [[nodiscard]] size_t cached_bitmap_count() const noexcept { return m_bitmaps.size(); }
    [[nodiscard]] size_t cached_face_count() const noexcept { return m_faces.size(); }

private:
    // CV_8UC1 glyph coverage of the unrotated block; empty when nothing is drawn
    cv::Mat text_coverage(const TextWatermark& text);
    cv::Mat hershey_coverage(const TextWatermark& text, const std::vector<std::string>& lines);
    cv::Mat truetype_coverage(const TextWatermark& text, const std::vector<std::string>& lines);

    std::map<std::pair<std::string, int>, FontMetrics> m_fonts;
    std::map<std::pair<std::string, int>, std::unique_ptr<TrueTypeFont>> m_faces;
    std::unordered_map<std::string, cv::Mat> m_bitmaps;
};

}  // namespace pwt
