/**
 * @file    watermark_engine.hpp
 * @brief   Photo Watermark Tool - Watermark Engine
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The one compose pipeline shared by preview and export:
 *
 *   layer    = renderer.render(spec, canvas.size)
 *   base     = resolve_anchor(canvas.size, layer.size, spec.anchor)
 *   offset   = resolve_offset(spec.offset, canvas.size)
 *   result   = compose(canvas, layer, base + offset)
 *
 * Same canvas + same spec => byte-identical result, whichever caller.
 */

#pragma once

#include "core/layer_renderer.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

namespace pwt {

/**
 * Output of one compose pass
 */
struct Composition {
    cv::Mat image;              // Composited canvas (CV_8UC4)
    cv::Point position;         // Layer top-left on the canvas
    cv::Size layer_size;        // Rendered layer size (after rotation)

    [[nodiscard]] cv::Rect layer_rect() const noexcept {
        return cv::Rect(position, layer_size);
    }
};

class WatermarkEngine {
public:
    /**
     * @param renderer  Layer renderer (must outlive the engine)
     */
    explicit WatermarkEngine(LayerRenderer& renderer);

    WatermarkEngine(const WatermarkEngine&) = delete;
    WatermarkEngine& operator=(const WatermarkEngine&) = delete;

    /**
     * Render and composite the watermark onto a canvas
     *
     * @param canvas  CV_8UC4 base image (not modified)
     * @param spec    Watermark description; the offset is resolved
     *                against this canvas
     * @throws WatermarkError on unreadable image watermark or bad input
     */
    [[nodiscard]] Composition apply(const cv::Mat& canvas, const WatermarkSpec& spec);

    /**
     * Draw position for a layer of `layer` size on `canvas`
     */
    [[nodiscard]] static cv::Point place(cv::Size canvas, cv::Size layer,
                                         const WatermarkSpec& spec) noexcept;

    [[nodiscard]] LayerRenderer& renderer() noexcept { return m_renderer; }

private:
    LayerRenderer& m_renderer;
};

}  // namespace pwt
