/**
 * @file    preview_session.cpp
 * @brief   Interactive preview state implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/preview_session.hpp"
#include "core/image_io.hpp"
#include "core/offset_translator.hpp"
#include "utils/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pwt {

PreviewSession::PreviewSession(WatermarkEngine& engine, PreviewLimits limits)
    : m_engine(engine)
    , m_limits(limits) {
    spdlog::debug("PreviewSession initialized ({}x{} cap)", limits.max_width, limits.max_height);
}

// =============================================================================
// Image
// =============================================================================

bool PreviewSession::load_image(const std::filesystem::path& path) {
    spdlog::info("Loading image: {}", path);

    cv::Mat original;
    try {
        original = pwt::load_image(path);
    } catch (const WatermarkError& e) {
        close_image();
        m_state = PreviewState::Error;
        m_error = e.what();
        spdlog::error("{}", m_error);
        return false;
    }

    m_path = path;
    m_original_size = original.size();
    m_canvas = fit_for_preview(original, m_limits);
    m_composed = m_canvas;
    m_layer_rect = cv::Rect();
    m_state = PreviewState::Loaded;
    m_error.clear();
    m_dirty = true;

    spdlog::info("Image loaded: {}x{} (preview {}x{})",
                 original.cols, original.rows, m_canvas.cols, m_canvas.rows);
    return true;
}

void PreviewSession::close_image() {
    m_path.reset();
    m_original_size = cv::Size();
    m_canvas.release();
    m_composed.release();
    m_layer_rect = cv::Rect();
    m_state = PreviewState::Idle;
    m_error.clear();
    m_dirty = true;
    spdlog::debug("Image closed");
}

// =============================================================================
// Watermark parameters
// =============================================================================

TextWatermark& PreviewSession::text_payload() {
    if (auto* text = std::get_if<TextWatermark>(&m_spec.payload)) {
        return *text;
    }
    return m_saved_text;
}

ImageWatermark& PreviewSession::image_payload() {
    if (auto* image = std::get_if<ImageWatermark>(&m_spec.payload)) {
        return *image;
    }
    return m_saved_image;
}

void PreviewSession::set_spec(const WatermarkSpec& spec) {
    m_spec = spec;
    clamp_spec(m_spec);
    m_dirty = true;
}

void PreviewSession::set_text(std::string content) {
    text_payload().content = std::move(content);
    m_dirty = true;
}

void PreviewSession::set_font(std::string font) {
    text_payload().font = std::move(font);
    m_dirty = true;
}

void PreviewSession::set_font_file(const std::filesystem::path& font_file) {
    text_payload().font_file = font_file;
    m_dirty = true;
}

void PreviewSession::set_font_size(int pixels) {
    text_payload().font_size = std::clamp(pixels, kMinFontSize, kMaxFontSize);
    m_dirty = true;
}

void PreviewSession::set_color(Rgb color) {
    text_payload().color = color;
    m_dirty = true;
}

void PreviewSession::set_opacity(float opacity) {
    const float clamped = std::clamp(opacity, 0.0f, 1.0f);
    if (m_spec.is_text()) {
        text_payload().opacity = clamped;
    } else {
        image_payload().opacity = clamped;
    }
    m_dirty = true;
}

void PreviewSession::set_image_watermark(const std::filesystem::path& source) {
    // Reselecting a file re-reads it from disk
    m_engine.renderer().forget(source);
    image_payload().source = source;
    m_dirty = true;
}

void PreviewSession::set_image_scale(int percent) {
    image_payload().scale_percent = std::clamp(percent, kMinScalePercent, kMaxScalePercent);
    m_dirty = true;
}

void PreviewSession::use_text_mode() {
    if (m_spec.is_text()) return;

    m_saved_image = std::get<ImageWatermark>(m_spec.payload);
    m_spec.payload = m_saved_text;
    m_dirty = true;
    spdlog::debug("Mode set to: Text");
}

void PreviewSession::use_image_mode() {
    if (m_spec.is_image()) return;

    m_saved_text = std::get<TextWatermark>(m_spec.payload);
    m_spec.payload = m_saved_image;
    m_dirty = true;
    spdlog::debug("Mode set to: Image");
}

void PreviewSession::set_anchor(Anchor anchor) {
    m_spec.anchor = anchor;
    m_spec.offset = PixelOffset{};
    m_dirty = true;
    spdlog::debug("Anchor set to: {}", to_string(anchor));
}

void PreviewSession::set_rotation(int degrees) {
    m_spec.rotation_degrees = std::clamp(degrees, kMinRotation, kMaxRotation);
    m_dirty = true;
}

void PreviewSession::drag_by(int dx, int dy) {
    PixelOffset current = resolve_offset(m_spec.offset, m_canvas.size());
    current.dx += dx;
    current.dy += dy;
    m_spec.offset = current;
    m_dirty = true;
}

void PreviewSession::reset_offset() {
    m_spec.offset = PixelOffset{};
    m_dirty = true;
}

// =============================================================================
// Composition
// =============================================================================

bool PreviewSession::update_if_needed() {
    if (!m_dirty) return false;
    m_dirty = false;

    if (!has_image()) {
        m_composed.release();
        m_layer_rect = cv::Rect();
        return false;
    }

    try {
        Composition result = m_engine.apply(m_canvas, m_spec);
        m_composed = std::move(result.image);
        m_layer_rect = result.layer_rect();
        m_error.clear();
        return true;
    } catch (const WatermarkError& e) {
        // Keep showing the plain canvas; the image itself is still valid
        m_composed = m_canvas;
        m_layer_rect = cv::Rect();
        m_error = e.what();
        spdlog::error("Preview failed: {}", m_error);
        return false;
    }
}

WatermarkSpec PreviewSession::export_spec() const {
    WatermarkSpec exported = m_spec;
    exported.offset = capture_ratio(m_spec.offset, m_canvas.size());
    return exported;
}

}  // namespace pwt
