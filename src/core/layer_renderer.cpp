/**
 * @file    layer_renderer.cpp
 * @brief   Watermark layer rendering implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/layer_renderer.hpp"
#include "core/image_io.hpp"
#include "utils/path_utils.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace pwt {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

cv::Mat blank_layer() {
    return cv::Mat(1, 1, CV_8UC4, cv::Scalar(0, 0, 0, 0));
}

// Drop ink-free columns; empty when nothing was drawn
cv::Mat crop_columns(const cv::Mat& coverage) {
    const cv::Rect ink = cv::boundingRect(coverage);
    if (ink.empty()) {
        return cv::Mat();
    }
    return coverage.colRange(ink.x, ink.x + ink.width).clone();
}

void premultiply(cv::Mat& bgra) {
    for (int y = 0; y < bgra.rows; ++y) {
        auto* row = bgra.ptr<cv::Vec4b>(y);
        for (int x = 0; x < bgra.cols; ++x) {
            const int a = row[x][3];
            for (int c = 0; c < 3; ++c) {
                row[x][c] = static_cast<uchar>((row[x][c] * a + 127) / 255);
            }
        }
    }
}

void unpremultiply(cv::Mat& bgra) {
    for (int y = 0; y < bgra.rows; ++y) {
        auto* row = bgra.ptr<cv::Vec4b>(y);
        for (int x = 0; x < bgra.cols; ++x) {
            const int a = row[x][3];
            for (int c = 0; c < 3; ++c) {
                row[x][c] = (a == 0)
                    ? uchar{0}
                    : static_cast<uchar>(std::min(255, (row[x][c] * 255 + a / 2) / a));
            }
        }
    }
}

// Resample straight-alpha BGRA without dark fringes
cv::Mat resize_premultiplied(const cv::Mat& bgra, cv::Size target) {
    cv::Mat pre = bgra.clone();
    premultiply(pre);

    const int interp = (target.width < bgra.cols || target.height < bgra.rows)
                       ? cv::INTER_AREA
                       : cv::INTER_CUBIC;

    cv::Mat resized;
    cv::resize(pre, resized, target, 0, 0, interp);
    unpremultiply(resized);
    return resized;
}

}  // anonymous namespace

// =============================================================================
// RenderedLayer
// =============================================================================

bool RenderedLayer::is_blank() const {
    if (m_pixels.empty()) return true;

    cv::Mat alpha;
    cv::extractChannel(m_pixels, alpha, 3);
    return cv::countNonZero(alpha) == 0;
}

// =============================================================================
// Free helpers
// =============================================================================

int resolve_font_face(const std::string& font) {
    std::string family = font;
    int flags = 0;

    constexpr std::string_view kItalic = "-italic";
    if (family.size() > kItalic.size() &&
        family.compare(family.size() - kItalic.size(), kItalic.size(), kItalic) == 0) {
        family.erase(family.size() - kItalic.size());
        flags = cv::FONT_ITALIC;
    }

    if (family == "sans")       return cv::FONT_HERSHEY_SIMPLEX | flags;
    if (family == "sans-bold")  return cv::FONT_HERSHEY_DUPLEX | flags;
    if (family == "serif")      return cv::FONT_HERSHEY_COMPLEX | flags;
    if (family == "serif-bold") return cv::FONT_HERSHEY_TRIPLEX | flags;
    if (family == "script")     return cv::FONT_HERSHEY_SCRIPT_SIMPLEX | flags;
    if (family == "plain")      return cv::FONT_HERSHEY_PLAIN | flags;

    spdlog::warn("Unknown font '{}', using sans", font);
    return cv::FONT_HERSHEY_SIMPLEX | flags;
}

cv::Mat rotate_expand(const cv::Mat& bgra, double degrees) {
    if (bgra.empty() || degrees == 0.0) {
        return bgra;
    }

    const cv::Point2f center((bgra.cols - 1) * 0.5f, (bgra.rows - 1) * 0.5f);
    cv::Mat matrix = cv::getRotationMatrix2D(center, degrees, 1.0);

    // Bounding box of the rotated corners (epsilon absorbs cos(90) noise)
    const double radians = degrees * CV_PI / 180.0;
    const double c = std::abs(std::cos(radians));
    const double s = std::abs(std::sin(radians));
    const int new_w = std::max(1, static_cast<int>(std::ceil(bgra.cols * c + bgra.rows * s - 1e-6)));
    const int new_h = std::max(1, static_cast<int>(std::ceil(bgra.cols * s + bgra.rows * c - 1e-6)));

    matrix.at<double>(0, 2) += (new_w - 1) * 0.5 - center.x;
    matrix.at<double>(1, 2) += (new_h - 1) * 0.5 - center.y;

    cv::Mat pre = bgra.clone();
    premultiply(pre);

    cv::Mat rotated;
    cv::warpAffine(pre, rotated, matrix, cv::Size(new_w, new_h),
                   cv::INTER_CUBIC, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
    unpremultiply(rotated);

    spdlog::debug("Rotated layer {:.0f} deg: {}x{} -> {}x{}",
                  degrees, bgra.cols, bgra.rows, new_w, new_h);
    return rotated;
}

void multiply_alpha(cv::Mat& bgra, float opacity) {
    const float clamped = std::clamp(opacity, 0.0f, 1.0f);
    if (clamped >= 1.0f || bgra.empty()) return;

    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    alpha.convertTo(alpha, CV_8U, clamped);
    cv::insertChannel(alpha, bgra, 3);
}

// =============================================================================
// LayerRenderer
// =============================================================================

RenderedLayer LayerRenderer::render(const WatermarkSpec& spec, cv::Size canvas) {
    WatermarkSpec clamped = spec;
    clamp_spec(clamped);

    if (const auto* text = std::get_if<TextWatermark>(&clamped.payload)) {
        return render_text(*text, clamped.rotation_degrees);
    }
    return render_image(std::get<ImageWatermark>(clamped.payload),
                        canvas.width, clamped.rotation_degrees);
}

const FontMetrics& LayerRenderer::font_metrics(const std::string& font, int pixel_size) {
    const int size = std::clamp(pixel_size, kMinFontSize, kMaxFontSize);
    const auto key = std::make_pair(font, size);

    if (auto it = m_fonts.find(key); it != m_fonts.end()) {
        return it->second;
    }

    FontMetrics metrics;
    metrics.face = resolve_font_face(font);
    metrics.thickness = std::max(1, static_cast<int>(std::lround(size / 20.0)));
    metrics.scale = cv::getFontScaleFromHeight(metrics.face, size, metrics.thickness);

    // Line box spans the tallest and deepest printable glyphs. Brackets
    // and bars reach well above the capitals.
    const int extent = 2 * size + 2 * metrics.thickness;
    cv::Mat glyphs(2 * extent, 2 * extent, CV_8UC1, cv::Scalar(0));
    const cv::Point origin(extent / 2, extent);
    for (char c = '!'; c <= '~'; ++c) {
        cv::putText(glyphs, std::string(1, c), origin, metrics.face, metrics.scale,
                    cv::Scalar(255), metrics.thickness, cv::LINE_AA);
    }

    const cv::Rect ink = cv::boundingRect(glyphs);
    metrics.ascent = origin.y - ink.y;
    metrics.descent = std::max(0, ink.y + ink.height - origin.y);

    spdlog::debug("Font '{}' @ {}px: scale={:.3f} thickness={} line={}px",
                  font, size, metrics.scale, metrics.thickness, metrics.line_height());

    return m_fonts.emplace(key, metrics).first->second;
}

cv::Size LayerRenderer::measure_text(const TextWatermark& text) {
    return text_coverage(text).size();
}

cv::Mat LayerRenderer::text_coverage(const TextWatermark& text) {
    const auto lines = split_lines(text.content);
    if (lines.empty()) {
        return cv::Mat();
    }
    return text.font_file.empty() ? hershey_coverage(text, lines)
                                  : truetype_coverage(text, lines);
}

cv::Mat LayerRenderer::hershey_coverage(const TextWatermark& text,
                                        const std::vector<std::string>& lines) {
    if (!is_ascii(text.content)) {
        spdlog::warn("Built-in fonts draw ASCII only; set a font file to render \"{}\"",
                     text.content);
    }

    const FontMetrics& metrics = font_metrics(text.font, text.font_size);

    int width = 0;
    for (const auto& line : lines) {
        if (line.empty()) continue;
        int baseline = 0;
        const cv::Size size = cv::getTextSize(line, metrics.face, metrics.scale,
                                              metrics.thickness, &baseline);
        width = std::max(width, size.width);
    }
    if (width <= 0) {
        return cv::Mat();
    }

    // Slanted and overhanging strokes stay within one ascent of the advance box
    const int pad = metrics.ascent;
    const int line_h = metrics.line_height();
    cv::Mat coverage(line_h * static_cast<int>(lines.size()), width + 2 * pad,
                     CV_8UC1, cv::Scalar(0));

    for (size_t i = 0; i < lines.size(); ++i) {
        const int baseline_y = static_cast<int>(i) * line_h + metrics.ascent;
        cv::putText(coverage, lines[i], cv::Point(pad, baseline_y), metrics.face,
                    metrics.scale, cv::Scalar(255), metrics.thickness, cv::LINE_AA);
    }
    return crop_columns(coverage);
}

cv::Mat LayerRenderer::truetype_coverage(const TextWatermark& text,
                                         const std::vector<std::string>& lines) {
    TrueTypeFont& font = truetype_font(text.font_file, text.font_size);
    const int line_h = font.line_height();

    // Union of the ink with the nominal line boxes, baseline of line 0 at y = 0
    cv::Rect ink;
    for (size_t i = 0; i < lines.size(); ++i) {
        cv::Rect bounds = font.ink_bounds(lines[i]);
        if (bounds.empty()) continue;
        bounds.y += static_cast<int>(i) * line_h;
        ink = ink.empty() ? bounds : (ink | bounds);
    }
    if (ink.empty()) {
        return cv::Mat();
    }

    const int top = std::min(ink.y, -font.ascent());
    const int bottom = std::max(ink.y + ink.height,
                                (static_cast<int>(lines.size()) - 1) * line_h + font.descent());

    cv::Mat coverage(bottom - top, ink.width, CV_8UC1, cv::Scalar(0));
    for (size_t i = 0; i < lines.size(); ++i) {
        font.draw(coverage, lines[i],
                  cv::Point(-ink.x, static_cast<int>(i) * line_h - top));
    }
    return coverage;
}

RenderedLayer LayerRenderer::render_text(const TextWatermark& text, int rotation_degrees) {
    const cv::Mat coverage = text_coverage(text);
    if (coverage.empty()) {
        spdlog::debug("Text layer is empty, rendering 1x1 transparent layer");
        return RenderedLayer(blank_layer());
    }

    // Alpha carries opacity from the start; colour is uniform
    cv::Mat alpha;
    coverage.convertTo(alpha, CV_8U, std::clamp(text.opacity, 0.0f, 1.0f));

    cv::Mat layer(coverage.size(), CV_8UC4,
                  cv::Scalar(text.color.b, text.color.g, text.color.r, 0));
    cv::insertChannel(alpha, layer, 3);

    spdlog::debug("Text layer: {}x{} ({}px, {})", layer.cols, layer.rows, text.font_size,
                  text.font_file.empty() ? text.font : to_utf8(text.font_file));

    return RenderedLayer(rotate_expand(layer, rotation_degrees));
}

RenderedLayer LayerRenderer::render_image(const ImageWatermark& image,
                                          int canvas_width,
                                          int rotation_degrees) {
    const cv::Mat& source = watermark_bitmap(image.source);

    const int scale = std::clamp(image.scale_percent, kMinScalePercent, kMaxScalePercent);
    const int target_w = std::max(1, static_cast<int>(std::lround(scale / 100.0 * canvas_width)));
    const int target_h = std::max(1, static_cast<int>(
        std::lround(static_cast<double>(source.rows) * target_w / source.cols)));

    cv::Mat layer = (target_w == source.cols && target_h == source.rows)
                    ? source.clone()
                    : resize_premultiplied(source, cv::Size(target_w, target_h));

    multiply_alpha(layer, image.opacity);

    spdlog::debug("Image layer: {}x{} -> {}x{} ({}% of {}px)",
                  source.cols, source.rows, target_w, target_h, scale, canvas_width);

    return RenderedLayer(rotate_expand(layer, rotation_degrees));
}

const cv::Mat& LayerRenderer::watermark_bitmap(const std::filesystem::path& path) {
    const std::string key = to_utf8(path.lexically_normal());

    if (auto it = m_bitmaps.find(key); it != m_bitmaps.end()) {
        return it->second;
    }

    if (path.empty()) {
        throw WatermarkError(ErrorCode::LoadFailure, "No watermark image selected");
    }

    cv::Mat bitmap = load_image(path);
    spdlog::info("Loaded watermark image: {} ({}x{})", path, bitmap.cols, bitmap.rows);

    return m_bitmaps.emplace(key, std::move(bitmap)).first->second;
}

TrueTypeFont& LayerRenderer::truetype_font(const std::filesystem::path& path, int pixel_size) {
    const int size = std::clamp(pixel_size, kMinFontSize, kMaxFontSize);
    auto key = std::make_pair(to_utf8(path.lexically_normal()), size);

    if (auto it = m_faces.find(key); it != m_faces.end()) {
        return *it->second;
    }

    if (path.empty()) {
        throw WatermarkError(ErrorCode::LoadFailure, "No font file selected");
    }

    auto font = std::make_unique<TrueTypeFont>(path, size);
    spdlog::info("Loaded font file: {} ({}, {}px)", path, font->family(), size);

    return *m_faces.emplace(std::move(key), std::move(font)).first->second;
}

void LayerRenderer::forget(const std::filesystem::path& path) {
    m_bitmaps.erase(to_utf8(path.lexically_normal()));
}

void LayerRenderer::clear_cache() {
    m_fonts.clear();
    m_faces.clear();
    m_bitmaps.clear();
}

}  // namespace pwt
