/**
 * @file    image_io.cpp
 * @brief   Image discovery, decoding, preview fitting and encoding
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/image_io.hpp"
#include "core/geometry.hpp"
#include "utils/path_utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace pwt {

namespace {

void append_if_supported(const fs::path& path,
                         std::set<fs::path>& seen,
                         std::vector<fs::path>& out) {
    if (!is_supported_extension(path)) return;

    const fs::path key = path.lexically_normal();
    if (seen.insert(key).second) {
        out.push_back(path);
    }
}

#ifdef _WIN32
// OpenCV imread/imwrite take ANSI paths on Windows; go through memory instead
cv::Mat decode_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return cv::Mat();
    }

    const auto size = file.tellg();
    if (size <= 0) {
        return cv::Mat();
    }
    file.seekg(0, std::ios::beg);

    std::vector<uchar> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return cv::Mat();
    }
    return cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
}

bool encode_file(const fs::path& path, const cv::Mat& image,
                 const std::string& ext, const std::vector<int>& params) {
    std::vector<uchar> buffer;
    if (!cv::imencode(ext, image, buffer, params)) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    return file.good();
}
#else
cv::Mat decode_file(const fs::path& path) {
    return cv::imread(path.string(), cv::IMREAD_UNCHANGED);
}

bool encode_file(const fs::path& path, const cv::Mat& image,
                 const std::string& /*ext*/, const std::vector<int>& params) {
    return cv::imwrite(path.string(), image, params);
}
#endif

}  // anonymous namespace

// =============================================================================
// Discovery
// =============================================================================

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> kExtensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff"
    };
    return kExtensions;
}

bool is_supported_extension(const fs::path& path) {
    const std::string ext = lowercase_extension(path);
    const auto& supported = supported_extensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

std::vector<fs::path> collect_images(std::span<const fs::path> inputs) {
    std::vector<fs::path> result;
    std::set<fs::path> seen;

    for (const auto& input : inputs) {
        std::error_code ec;

        if (fs::is_directory(input, ec)) {
            std::vector<fs::path> found;
            for (fs::recursive_directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    found.push_back(it->path());
                }
            }
            if (ec) {
                spdlog::warn("Error while scanning {}: {}", input, ec.message());
            }

            // Directory iteration order is unspecified
            std::sort(found.begin(), found.end());
            for (const auto& file : found) {
                append_if_supported(file, seen, result);
            }
        } else if (fs::is_regular_file(input, ec)) {
            append_if_supported(input, seen, result);
        } else {
            spdlog::warn("Skipping missing path: {}", input);
        }
    }

    spdlog::debug("Collected {} image(s) from {} input(s)", result.size(), inputs.size());
    return result;
}

// =============================================================================
// Decoding
// =============================================================================

cv::Mat to_bgra(const cv::Mat& image) {
    if (image.empty()) {
        return cv::Mat();
    }

    cv::Mat eight_bit = image;
    switch (image.depth()) {
        case CV_8U:
            break;
        case CV_16U:
            image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            // Floating point samples are normalised to [0, 1]
            image.convertTo(eight_bit, CV_8U, 255.0);
            break;
        default:
            throw WatermarkError(ErrorCode::LoadFailure,
                                 fmt::format("Unsupported sample depth: {}", image.depth()));
    }

    cv::Mat bgra;
    switch (eight_bit.channels()) {
        case 1:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            bgra = eight_bit;
            break;
        default:
            throw WatermarkError(ErrorCode::LoadFailure,
                                 fmt::format("Unsupported channel count: {}", eight_bit.channels()));
    }
    return bgra;
}

cv::Mat load_image(const fs::path& path) {
    spdlog::debug("Decoding: {}", path);

    cv::Mat decoded;
    try {
        decoded = decode_file(path);
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("Failed to decode {}: {}", filename_utf8(path), e.what()));
    }

    if (decoded.empty()) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("Failed to load image: {}", filename_utf8(path)));
    }

    cv::Mat bgra = to_bgra(decoded);
    spdlog::debug("Decoded {}: {}x{} ({} channels)",
                  filename_utf8(path), bgra.cols, bgra.rows, decoded.channels());
    return bgra;
}

cv::Mat fit_for_preview(const cv::Mat& image, const PreviewLimits& limits) {
    const cv::Size target = fit_within(image.size(), limits);
    if (target == image.size()) {
        return image;
    }

    cv::Mat fitted;
    cv::resize(image, fitted, target, 0, 0, cv::INTER_AREA);

    spdlog::debug("Preview fit: {}x{} -> {}x{}",
                  image.cols, image.rows, fitted.cols, fitted.rows);
    return fitted;
}

// =============================================================================
// Encoding
// =============================================================================

void write_image(const fs::path& path, const cv::Mat& image,
                 OutputFormat format, int jpeg_quality) {
    spdlog::debug("Writing: {} ({}x{})", path, image.cols, image.rows);

    cv::Mat encoded;
    std::vector<int> params;
    std::string ext;

    if (format == OutputFormat::Png) {
        encoded = image;
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
        ext = ".png";
    } else {
        // Composited pixels already carry the blend; alpha is dropped
        if (image.channels() == 4) {
            cv::cvtColor(image, encoded, cv::COLOR_BGRA2BGR);
        } else {
            encoded = image;
        }
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(jpeg_quality, 1, 100),
                  cv::IMWRITE_JPEG_OPTIMIZE, 1};
        ext = ".jpg";
    }

    bool written = false;
    try {
        written = encode_file(path, encoded, ext, params);
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorCode::WriteFailure,
                             fmt::format("Failed to encode {}: {}", filename_utf8(path), e.what()));
    }

    if (!written) {
        throw WatermarkError(ErrorCode::WriteFailure,
                             fmt::format("Failed to write image: {}", to_utf8(path)));
    }
}

}  // namespace pwt
