/**
 * @file    preview_session.hpp
 * @brief   Interactive preview state
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Holds everything a preview surface needs: the selected image, its
 * preview-scaled canvas, the watermark being edited and the last
 * composition. Any input mechanism drives it through setters and
 * drag deltas; no event loop is assumed.
 *
 * Setters only mark the session dirty. Call update_if_needed() once per
 * frame/tick so bursts of input (drag, scroll) cost a single recompose.
 */

#pragma once

#include "core/types.hpp"
#include "core/watermark_engine.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pwt {

/**
 * Preview state machine
 */
enum class PreviewState {
    Idle,       // No image loaded
    Loaded,     // Image loaded, composition available
    Error       // Last load failed
};

[[nodiscard]] constexpr std::string_view to_string(PreviewState state) noexcept {
    switch (state) {
        case PreviewState::Idle:   return "Idle";
        case PreviewState::Loaded: return "Loaded";
        case PreviewState::Error:  return "Error";
        default:                   return "Unknown";
    }
}

class PreviewSession {
public:
    /**
     * @param engine  Compose pipeline (must outlive the session)
     * @param limits  Preview canvas cap
     */
    explicit PreviewSession(WatermarkEngine& engine, PreviewLimits limits = {});

    PreviewSession(const PreviewSession&) = delete;
    PreviewSession& operator=(const PreviewSession&) = delete;

    // ==========================================================================
    // Image
    // ==========================================================================

    /**
     * Load an image and build its preview canvas
     * @return false on failure; error_message() says why
     */
    bool load_image(const std::filesystem::path& path);

    void close_image();

    [[nodiscard]] bool has_image() const noexcept { return !m_canvas.empty(); }
    [[nodiscard]] const std::optional<std::filesystem::path>& file_path() const noexcept { return m_path; }
    [[nodiscard]] cv::Size original_size() const noexcept { return m_original_size; }
    [[nodiscard]] const cv::Mat& canvas() const noexcept { return m_canvas; }

    // ==========================================================================
    // Watermark parameters
    // ==========================================================================

    [[nodiscard]] const WatermarkSpec& spec() const noexcept { return m_spec; }

    /**
     * Replace the whole spec (e.g. restored from a template)
     */
    void set_spec(const WatermarkSpec& spec);

    void set_text(std::string content);
    void set_font(std::string font);
    void set_font_file(const std::filesystem::path& font_file);
    void set_font_size(int pixels);
    void set_color(Rgb color);
    void set_opacity(float opacity);

    void set_image_watermark(const std::filesystem::path& source);
    void set_image_scale(int percent);

    /**
     * Switch payload kind, keeping anchor/offset/rotation
     * The payload being left is remembered and restored on switch back.
     */
    void use_text_mode();
    void use_image_mode();

    /**
     * Set anchor; the drag offset is reset to zero
     */
    void set_anchor(Anchor anchor);
    void set_rotation(int degrees);

    /**
     * Accumulate a drag delta measured on the preview canvas
     */
    void drag_by(int dx, int dy);
    void reset_offset();

    // ==========================================================================
    // Composition
    // ==========================================================================

    void invalidate() noexcept { m_dirty = true; }
    [[nodiscard]] bool needs_update() const noexcept { return m_dirty; }

    /**
     * Recompose if dirty
     * @return true if a new composition was produced
     */
    bool update_if_needed();

    /**
     * Latest composition (the canvas itself until the first update)
     */
    [[nodiscard]] const cv::Mat& composed() const noexcept { return m_composed; }

    /**
     * Where the watermark sits on the preview canvas
     */
    [[nodiscard]] cv::Rect layer_rect() const noexcept { return m_layer_rect; }

    /**
     * Whether a preview-canvas point lies on the watermark (drag start)
     */
    [[nodiscard]] bool hit_test(cv::Point point) const noexcept { return m_layer_rect.contains(point); }

    /**
     * Spec to hand to the exporter: offset captured as a ratio of the
     * preview canvas
     */
    [[nodiscard]] WatermarkSpec export_spec() const;

    // ==========================================================================
    // Status
    // ==========================================================================

    [[nodiscard]] PreviewState state() const noexcept { return m_state; }
    [[nodiscard]] const std::string& error_message() const noexcept { return m_error; }

private:
    WatermarkEngine& m_engine;
    PreviewLimits m_limits;

    PreviewState m_state{PreviewState::Idle};
    std::optional<std::filesystem::path> m_path;
    cv::Size m_original_size;
    cv::Mat m_canvas;           // Preview-scaled source (CV_8UC4)
    cv::Mat m_composed;

    WatermarkSpec m_spec;
    TextWatermark m_saved_text;
    ImageWatermark m_saved_image;

    bool m_dirty{true};
    cv::Rect m_layer_rect;
    std::string m_error;

    TextWatermark& text_payload();
    ImageWatermark& image_payload();
};

}  // namespace pwt
