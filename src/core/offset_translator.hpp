/**
 * @file    offset_translator.hpp
 * @brief   Pixel <-> ratio offset translation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The preview runs on a downscaled copy of the source. A drag offset
 * captured there is stored as a fraction of the preview canvas and
 * replayed on any other canvas:
 *
 *   ratio  = pixel / preview_dimension
 *   pixel' = round(ratio * target_dimension)
 *
 * On an unchanged canvas the round trip is exact.
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

namespace pwt {

/**
 * Pixel offset -> ratio of canvas (0 for a zero-sized axis)
 */
[[nodiscard]] RatioOffset to_ratio(PixelOffset offset, cv::Size canvas) noexcept;

/**
 * Ratio offset -> pixel offset on canvas (rounded to nearest)
 */
[[nodiscard]] PixelOffset to_pixels(RatioOffset offset, cv::Size canvas) noexcept;

/**
 * Pixel offset to apply on `canvas` for either offset kind
 */
[[nodiscard]] PixelOffset resolve_offset(const PlacementOffset& offset, cv::Size canvas) noexcept;

/**
 * Ratio form of either offset kind, measured against `canvas`
 */
[[nodiscard]] RatioOffset capture_ratio(const PlacementOffset& offset, cv::Size canvas) noexcept;

}  // namespace pwt
