/**
 * @file    compositor.hpp
 * @brief   Alpha compositing of a watermark layer onto a base image
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Straight-alpha "over" operator, per pixel:
 *   outA = a + dA * (1 - a)
 *   outC = (sC * a + dC * dA * (1 - a)) / outA
 *
 * The layer rectangle is clipped to the canvas, so any position (even
 * fully off-canvas) is legal. Layer pixels with a == 0 leave the base
 * pixel untouched.
 */

#pragma once

#include "core/layer_renderer.hpp"

#include <opencv2/core.hpp>

namespace pwt {

/**
 * Composite a layer over a base image
 *
 * @param base      CV_8UC4 base image (not modified)
 * @param layer     CV_8UC4 layer
 * @param position  Top-left of the layer in base coordinates
 * @return          New CV_8UC4 image
 * @throws WatermarkError(InvalidParameter) if either input is not CV_8UC4
 */
[[nodiscard]] cv::Mat compose(const cv::Mat& base, const cv::Mat& layer, cv::Point position);

[[nodiscard]] inline cv::Mat compose(const cv::Mat& base, const RenderedLayer& layer,
                                     cv::Point position) {
    return compose(base, layer.pixels(), position);
}

/**
 * Visible part of a layer placed at `position` (empty if fully clipped)
 */
[[nodiscard]] cv::Rect clip_to_canvas(cv::Size canvas, cv::Size layer, cv::Point position) noexcept;

}  // namespace pwt
