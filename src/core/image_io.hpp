/**
 * @file    image_io.hpp
 * @brief   Image discovery, decoding, preview fitting and encoding
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Every image inside the engine is 8-bit BGRA (CV_8UC4). Decoding converts
 * grey, BGR and 16-bit inputs to that layout; encoding flattens to BGR for
 * JPEG.
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace pwt {

/**
 * Supported input extensions (lower case, with dot)
 */
[[nodiscard]] const std::vector<std::string>& supported_extensions();

/**
 * Check if file extension is supported (case-insensitive)
 */
[[nodiscard]] bool is_supported_extension(const std::filesystem::path& path);

/**
 * Expand files and directories into a list of supported image files
 *
 * Directories are walked recursively. Duplicates are dropped while the
 * first-seen order is kept. Missing paths are skipped with a warning.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_images(
    std::span<const std::filesystem::path> inputs);

/**
 * Convert any 8/16-bit or float 1/3/4-channel image to CV_8UC4
 *
 * Float samples are taken as [0, 1]. Signed depths are rejected.
 * @throws WatermarkError(LoadFailure) for unsupported depth or channels
 */
[[nodiscard]] cv::Mat to_bgra(const cv::Mat& image);

/**
 * Decode an image file to BGRA
 * @throws WatermarkError(LoadFailure) if the file cannot be decoded
 */
[[nodiscard]] cv::Mat load_image(const std::filesystem::path& path);

/**
 * Downscale to fit within limits (area filter), never upscale
 * Returns the input (shared data) when it already fits.
 */
[[nodiscard]] cv::Mat fit_for_preview(const cv::Mat& image, const PreviewLimits& limits);

/**
 * Encode and write a BGRA image
 *
 * PNG keeps the alpha channel (compression 6). JPEG drops alpha and
 * uses the given quality with optimized Huffman tables.
 *
 * @throws WatermarkError(WriteFailure) if encoding or writing fails
 */
void write_image(const std::filesystem::path& path, const cv::Mat& image,
                 OutputFormat format, int jpeg_quality);

}  // namespace pwt
