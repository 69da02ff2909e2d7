/**
 * @file    types.hpp
 * @brief   Shared type definitions for Photo Watermark Tool
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Watermark description, placement offsets, export settings and the
 * error type shared by every core module.
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace pwt {

// =============================================================================
// Errors
// =============================================================================

enum class ErrorCode {
    LoadFailure,        // Source or watermark image unreadable
    WriteFailure,       // Output could not be written
    InvalidParameter    // Rejected at the configuration boundary
};

[[nodiscard]] constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::LoadFailure:      return "Load failure";
        case ErrorCode::WriteFailure:     return "Write failure";
        case ErrorCode::InvalidParameter: return "Invalid parameter";
        default:                          return "Unknown";
    }
}

class WatermarkError : public std::runtime_error {
public:
    WatermarkError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

// =============================================================================
// Anchor
// =============================================================================

/**
 * Nine reference points on a canvas (3x3 grid)
 */
enum class Anchor {
    TopLeft,    TopCenter,    TopRight,
    MiddleLeft, Center,       MiddleRight,
    BottomLeft, BottomCenter, BottomRight
};

[[nodiscard]] constexpr std::string_view to_string(Anchor anchor) noexcept {
    switch (anchor) {
        case Anchor::TopLeft:      return "top-left";
        case Anchor::TopCenter:    return "top-center";
        case Anchor::TopRight:     return "top-right";
        case Anchor::MiddleLeft:   return "middle-left";
        case Anchor::Center:       return "center";
        case Anchor::MiddleRight:  return "middle-right";
        case Anchor::BottomLeft:   return "bottom-left";
        case Anchor::BottomCenter: return "bottom-center";
        case Anchor::BottomRight:  return "bottom-right";
        default:                   return "bottom-right";
    }
}

/**
 * Parse anchor name. Unknown names map to BottomRight.
 */
[[nodiscard]] Anchor parse_anchor(std::string_view name) noexcept;

// =============================================================================
// Placement Offset
// =============================================================================

/**
 * Offset in pixels, tied to the canvas it was measured on
 */
struct PixelOffset {
    int dx{0};
    int dy{0};

    bool operator==(const PixelOffset&) const = default;
};

/**
 * Offset as a fraction of canvas width/height (resolution independent)
 */
struct RatioOffset {
    double rx{0.0};
    double ry{0.0};

    bool operator==(const RatioOffset&) const = default;
};

using PlacementOffset = std::variant<PixelOffset, RatioOffset>;

// =============================================================================
// Watermark Description
// =============================================================================

inline constexpr int kMinFontSize = 6;
inline constexpr int kMaxFontSize = 400;
inline constexpr int kMinScalePercent = 1;
inline constexpr int kMaxScalePercent = 400;
inline constexpr int kMinRotation = -180;
inline constexpr int kMaxRotation = 180;

/**
 * RGB colour (stored as RGB, converted to BGR at render time)
 */
struct Rgb {
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};

    bool operator==(const Rgb&) const = default;
};

/**
 * Parse "#RRGGBB", "RRGGBB", "R,G,B" or a basic colour name
 * (white, black, red, green, blue, yellow, gray)
 */
[[nodiscard]] std::optional<Rgb> parse_color(std::string_view text);

struct TextWatermark {
    std::string content;
    std::string font{"sans"};   // Built-in family, used when no font file is set
    std::filesystem::path font_file;    // TrueType/OpenType file; any script
    int font_size{32};          // Pixels, [6, 400]
    Rgb color{};
    float opacity{0.5f};        // [0, 1]
};

struct ImageWatermark {
    std::filesystem::path source;
    int scale_percent{20};      // Percent of base canvas width, [1, 400]
    float opacity{1.0f};        // [0, 1]
};

using WatermarkPayload = std::variant<TextWatermark, ImageWatermark>;

/**
 * Watermark envelope
 *
 * Anchor, offset and rotation are shared by both payload kinds so that
 * switching between text and image keeps the user's placement.
 */
struct WatermarkSpec {
    WatermarkPayload payload{TextWatermark{}};
    Anchor anchor{Anchor::BottomRight};
    PlacementOffset offset{PixelOffset{}};
    int rotation_degrees{0};    // [-180, 180]

    [[nodiscard]] bool is_text() const noexcept {
        return std::holds_alternative<TextWatermark>(payload);
    }
    [[nodiscard]] bool is_image() const noexcept {
        return std::holds_alternative<ImageWatermark>(payload);
    }
};

/**
 * Clamp every field of the spec to its legal range
 */
void clamp_spec(WatermarkSpec& spec) noexcept;

// =============================================================================
// Export Settings
// =============================================================================

enum class OutputFormat { Png, Jpeg };

enum class NamingRule { Keep, Prefix, Suffix };

enum class ResizeMode { Width, Height, Percent };

/**
 * Which canvas the exporter composes on
 *
 * Preview reproduces exactly the preview-scaled image the user approved.
 * Original composes at full source resolution with the ratio offset.
 */
enum class ExportCanvas { Preview, Original };

[[nodiscard]] constexpr std::string_view to_string(OutputFormat format) noexcept {
    return format == OutputFormat::Png ? "png" : "jpeg";
}

[[nodiscard]] constexpr std::string_view to_string(NamingRule rule) noexcept {
    switch (rule) {
        case NamingRule::Keep:   return "keep";
        case NamingRule::Prefix: return "prefix";
        case NamingRule::Suffix: return "suffix";
        default:                 return "keep";
    }
}

[[nodiscard]] constexpr std::string_view to_string(ResizeMode mode) noexcept {
    switch (mode) {
        case ResizeMode::Width:   return "width";
        case ResizeMode::Height:  return "height";
        case ResizeMode::Percent: return "percent";
        default:                  return "percent";
    }
}

struct ResizeSpec {
    ResizeMode mode{ResizeMode::Percent};
    int value{100};
};

/**
 * Maximum preview canvas; images are scaled down (never up) to fit
 */
struct PreviewLimits {
    int max_width{900};
    int max_height{700};
};

struct ExportSettings {
    std::filesystem::path output_dir;
    OutputFormat format{OutputFormat::Png};
    NamingRule naming{NamingRule::Keep};
    std::string prefix{"wm_"};
    std::string suffix{"_watermarked"};
    int jpeg_quality{90};       // [1, 100]
    std::optional<ResizeSpec> resize;
    ExportCanvas canvas{ExportCanvas::Preview};
    PreviewLimits preview_limits{};
};

/**
 * Validate export settings
 * @throws WatermarkError(InvalidParameter) on the first invalid field
 */
void validate(const ExportSettings& settings);

// =============================================================================
// Results
// =============================================================================

/**
 * Outcome of exporting a single source image
 */
struct ExportItemResult {
    std::filesystem::path source;
    std::filesystem::path output;   // Empty when the export failed
    bool success{false};
    std::string message;
};

/**
 * Aggregate batch outcome
 */
struct BatchResult {
    int success{0};
    int failed{0};

    [[nodiscard]] int total() const noexcept { return success + failed; }
};

}  // namespace pwt
