/**
 * @file    watermark_engine.cpp
 * @brief   Photo Watermark Tool - Watermark Engine
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/watermark_engine.hpp"
#include "core/compositor.hpp"
#include "core/geometry.hpp"
#include "core/offset_translator.hpp"

#include <spdlog/spdlog.h>

namespace pwt {

WatermarkEngine::WatermarkEngine(LayerRenderer& renderer)
    : m_renderer(renderer) {
}

cv::Point WatermarkEngine::place(cv::Size canvas, cv::Size layer,
                                 const WatermarkSpec& spec) noexcept {
    const PixelOffset offset = resolve_offset(spec.offset, canvas);
    return resolve_position(canvas, layer, spec.anchor, offset);
}

Composition WatermarkEngine::apply(const cv::Mat& canvas, const WatermarkSpec& spec) {
    if (canvas.empty()) {
        throw WatermarkError(ErrorCode::InvalidParameter, "Empty image provided");
    }

    RenderedLayer layer = m_renderer.render(spec, canvas.size());
    const cv::Point position = place(canvas.size(), layer.size(), spec);

    spdlog::debug("Compose {}x{} layer at ({}, {}) on {}x{} canvas (anchor: {})",
                  layer.width(), layer.height(), position.x, position.y,
                  canvas.cols, canvas.rows, to_string(spec.anchor));

    Composition result;
    result.image = compose(canvas, layer, position);
    result.position = position;
    result.layer_size = layer.size();
    return result;
}

}  // namespace pwt
