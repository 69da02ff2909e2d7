/**
 * @file    batch_exporter.hpp
 * @brief   Batch export of watermarked images
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * For each source, independently:
 *   load -> preview fit -> WatermarkEngine::apply -> resize -> name -> save
 *
 * A failing image (unreadable, unwritable) is logged and counted; the
 * batch always runs to the end. Settings are validated up front.
 *
 * Naming:
 *   keep    photo.JPG -> photo.png
 *   prefix  photo.JPG -> wm_photo.png
 *   suffix  photo.JPG -> photo_watermarked.png
 * Collisions append _1, _2, ... before the extension.
 */

#pragma once

#include "core/types.hpp"
#include "core/watermark_engine.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace pwt {

/**
 * Called after each source image is handled
 */
using ExportProgress = std::function<void(const ExportItemResult&)>;

/**
 * Output file name for a source under the naming rule (no directory)
 */
[[nodiscard]] std::string output_filename(const std::filesystem::path& source,
                                          const ExportSettings& settings);

/**
 * First non-existing path for `filename` in `dir` (name, name_1, name_2, ...)
 */
[[nodiscard]] std::filesystem::path unique_output_path(const std::filesystem::path& dir,
                                                       const std::string& filename);

/**
 * Resize with a Lanczos filter (no-op without a resize spec)
 */
[[nodiscard]] cv::Mat apply_resize(const cv::Mat& image, const std::optional<ResizeSpec>& resize);

class BatchExporter {
public:
    /**
     * @param engine  Shared compose pipeline (must outlive the exporter)
     */
    explicit BatchExporter(WatermarkEngine& engine);

    BatchExporter(const BatchExporter&) = delete;
    BatchExporter& operator=(const BatchExporter&) = delete;

    /**
     * Export every source with the same watermark
     *
     * @param sources   Source image paths
     * @param spec      Watermark; a pixel offset is taken as measured on
     *                  the preview canvas
     * @param settings  Export settings
     * @param progress  Optional per-file callback
     * @return          Aggregate success/failure counts
     * @throws WatermarkError(InvalidParameter) if settings are invalid
     */
    BatchResult export_batch(std::span<const std::filesystem::path> sources,
                             const WatermarkSpec& spec,
                             const ExportSettings& settings,
                             const ExportProgress& progress = {});

    /**
     * Export a single source (never throws for per-image failures)
     */
    ExportItemResult export_one(const std::filesystem::path& source,
                                const WatermarkSpec& spec,
                                const ExportSettings& settings);

    /**
     * Canvas and spec the exporter composes for a loaded source
     *
     * Preview canvas: the preview-fitted image, spec unchanged.
     * Original canvas: full-size image, offset converted to a ratio of
     * the preview canvas and text scaled up by the preview factor.
     */
    [[nodiscard]] static std::pair<cv::Mat, WatermarkSpec> prepare(
        const cv::Mat& original, const WatermarkSpec& spec, const ExportSettings& settings);

private:
    WatermarkEngine& m_engine;
};

}  // namespace pwt
