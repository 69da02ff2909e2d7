/**
 * @file    geometry.hpp
 * @brief   Watermark placement geometry
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Pure functions for anchor placement, preview fitting and export resizing.
 *
 * Anchor grid (m = kAnchorMargin):
 *   left:   x = m             top:    y = m
 *   center: x = (W - lw) / 2  middle: y = (H - lh) / 2
 *   right:  x = W - lw - m    bottom: y = H - lh - m
 *
 * Results are never clamped to the canvas; the compositor clips.
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

namespace pwt {

inline constexpr int kAnchorMargin = 16;

/**
 * Top-left corner of a layer placed at the given anchor
 *
 * @param canvas  Canvas size
 * @param layer   Layer size
 * @param anchor  Named anchor
 * @return        Base position (before user offset)
 */
[[nodiscard]] cv::Point resolve_anchor(cv::Size canvas, cv::Size layer, Anchor anchor) noexcept;

/**
 * Final draw position = anchor base + pixel offset
 */
[[nodiscard]] cv::Point resolve_position(cv::Size canvas, cv::Size layer,
                                         Anchor anchor, PixelOffset offset) noexcept;

/**
 * Uniform scale factor that fits `size` inside `limits` (never above 1.0)
 */
[[nodiscard]] double fit_scale(cv::Size size, const PreviewLimits& limits) noexcept;

/**
 * Size of `size` after fitting inside `limits` (minimum 1 px per axis)
 */
[[nodiscard]] cv::Size fit_within(cv::Size size, const PreviewLimits& limits) noexcept;

/**
 * Target size of an export resize
 * @throws WatermarkError(InvalidParameter) if resize.value <= 0
 */
[[nodiscard]] cv::Size resize_target(cv::Size size, const ResizeSpec& resize);

}  // namespace pwt
