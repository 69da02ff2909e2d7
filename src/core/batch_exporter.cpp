/**
 * @file    batch_exporter.cpp
 * @brief   Batch export implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/batch_exporter.hpp"
#include "core/geometry.hpp"
#include "core/image_io.hpp"
#include "core/offset_translator.hpp"
#include "utils/path_utils.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <system_error>

namespace fs = std::filesystem;

namespace pwt {

// =============================================================================
// Naming
// =============================================================================

std::string output_filename(const fs::path& source, const ExportSettings& settings) {
    std::string stem = stem_utf8(source);

    if (settings.naming == NamingRule::Prefix && !settings.prefix.empty()) {
        stem = settings.prefix + stem;
    } else if (settings.naming == NamingRule::Suffix && !settings.suffix.empty()) {
        stem += settings.suffix;
    }

    return stem + (settings.format == OutputFormat::Png ? ".png" : ".jpg");
}

fs::path unique_output_path(const fs::path& dir, const std::string& filename) {
    const fs::path name = path_from_utf8(filename);
    fs::path target = dir / name;

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return target;
    }

    const std::string stem = stem_utf8(name);
    const std::string ext = to_utf8(name.extension());
    for (int i = 1;; ++i) {
        target = dir / path_from_utf8(fmt::format("{}_{}{}", stem, i, ext));
        if (!fs::exists(target, ec)) {
            return target;
        }
    }
}

// =============================================================================
// Resize
// =============================================================================

cv::Mat apply_resize(const cv::Mat& image, const std::optional<ResizeSpec>& resize) {
    if (!resize) {
        return image;
    }

    const cv::Size target = resize_target(image.size(), *resize);
    if (target == image.size()) {
        return image;
    }

    cv::Mat resized;
    cv::resize(image, resized, target, 0, 0, cv::INTER_LANCZOS4);

    spdlog::debug("Resized ({} {}): {}x{} -> {}x{}",
                  to_string(resize->mode), resize->value,
                  image.cols, image.rows, resized.cols, resized.rows);
    return resized;
}

// =============================================================================
// BatchExporter
// =============================================================================

BatchExporter::BatchExporter(WatermarkEngine& engine)
    : m_engine(engine) {
}

std::pair<cv::Mat, WatermarkSpec> BatchExporter::prepare(
    const cv::Mat& original, const WatermarkSpec& spec, const ExportSettings& settings) {

    if (settings.canvas == ExportCanvas::Preview) {
        return {fit_for_preview(original, settings.preview_limits), spec};
    }

    // Full resolution: replay what the preview showed at a larger scale
    WatermarkSpec scaled = spec;
    const cv::Size preview_size = fit_within(original.size(), settings.preview_limits);
    scaled.offset = capture_ratio(spec.offset, preview_size);

    const double preview_scale = fit_scale(original.size(), settings.preview_limits);
    if (auto* text = std::get_if<TextWatermark>(&scaled.payload); text && preview_scale < 1.0) {
        const int enlarged = static_cast<int>(std::lround(text->font_size / preview_scale));
        text->font_size = std::clamp(enlarged, kMinFontSize, kMaxFontSize);
    }

    return {original, scaled};
}

ExportItemResult BatchExporter::export_one(const fs::path& source,
                                           const WatermarkSpec& spec,
                                           const ExportSettings& settings) {
    ExportItemResult result;
    result.source = source;

    try {
        const cv::Mat original = load_image(source);

        spdlog::info("Processing: {} ({}x{})", filename_utf8(source), original.cols, original.rows);

        auto [canvas, effective] = prepare(original, spec, settings);
        Composition composed = m_engine.apply(canvas, effective);
        cv::Mat output = apply_resize(composed.image, settings.resize);

        const fs::path target = unique_output_path(settings.output_dir,
                                                   output_filename(source, settings));
        write_image(target, output, settings.format, settings.jpeg_quality);

        result.output = target;
        result.success = true;
        result.message = fmt::format("{}x{} -> {}", output.cols, output.rows, filename_utf8(target));
        spdlog::info("Saved: {}", target);

    } catch (const std::exception& e) {
        result.success = false;
        result.message = e.what();
        spdlog::error("Error exporting {}: {}", source, e.what());
    }

    return result;
}

BatchResult BatchExporter::export_batch(std::span<const fs::path> sources,
                                        const WatermarkSpec& spec,
                                        const ExportSettings& settings,
                                        const ExportProgress& progress) {
    validate(settings);

    std::error_code ec;
    fs::create_directories(settings.output_dir, ec);
    if (ec) {
        // Every write will fail and be counted
        spdlog::error("Cannot create output directory {}: {}", settings.output_dir, ec.message());
    }

    spdlog::info("Exporting {} image(s) to {} (format: {}, naming: {})",
                 sources.size(), settings.output_dir,
                 to_string(settings.format), to_string(settings.naming));

    BatchResult batch;
    for (const auto& source : sources) {
        ExportItemResult item = export_one(source, spec, settings);
        if (item.success) {
            batch.success++;
        } else {
            batch.failed++;
        }

        if (progress) {
            progress(item);
        }
    }

    spdlog::info("Export complete: {} OK, {} failed", batch.success, batch.failed);
    return batch;
}

}  // namespace pwt
