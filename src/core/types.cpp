/**
 * @file    types.cpp
 * @brief   Shared type helpers (parsing, clamping, validation)
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>

namespace pwt {

Anchor parse_anchor(std::string_view name) noexcept {
    static constexpr std::array kAnchors = {
        Anchor::TopLeft,    Anchor::TopCenter,    Anchor::TopRight,
        Anchor::MiddleLeft, Anchor::Center,       Anchor::MiddleRight,
        Anchor::BottomLeft, Anchor::BottomCenter, Anchor::BottomRight
    };

    for (Anchor anchor : kAnchors) {
        if (to_string(anchor) == name) {
            return anchor;
        }
    }
    return Anchor::BottomRight;
}

std::optional<Rgb> parse_color(std::string_view text) {
    struct NamedColor {
        std::string_view name;
        Rgb rgb;
    };

    static constexpr std::array<NamedColor, 7> kNamed = {{
        {"white",  {255, 255, 255}},
        {"black",  {0, 0, 0}},
        {"red",    {255, 0, 0}},
        {"green",  {0, 128, 0}},
        {"blue",   {0, 0, 255}},
        {"yellow", {255, 255, 0}},
        {"gray",   {128, 128, 128}}
    }};

    for (const auto& [name, rgb] : kNamed) {
        if (text == name) return rgb;
    }

    // R,G,B
    if (text.find(',') != std::string_view::npos) {
        std::array<int, 3> parts{};
        size_t index = 0;
        const char* cursor = text.data();
        const char* end = text.data() + text.size();

        while (index < parts.size()) {
            auto [next, ec] = std::from_chars(cursor, end, parts[index]);
            if (ec != std::errc{} || parts[index] < 0 || parts[index] > 255) {
                return std::nullopt;
            }
            ++index;
            cursor = next;
            if (index < parts.size()) {
                if (cursor == end || *cursor != ',') return std::nullopt;
                ++cursor;
            }
        }
        if (cursor != end) return std::nullopt;

        return Rgb{static_cast<std::uint8_t>(parts[0]),
                   static_cast<std::uint8_t>(parts[1]),
                   static_cast<std::uint8_t>(parts[2])};
    }

    // #RRGGBB
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return std::nullopt;
    }

    unsigned int value = 0;
    auto [next, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc{} || next != text.data() + text.size()) {
        return std::nullopt;
    }

    return Rgb{static_cast<std::uint8_t>((value >> 16) & 0xFF),
               static_cast<std::uint8_t>((value >> 8) & 0xFF),
               static_cast<std::uint8_t>(value & 0xFF)};
}

void clamp_spec(WatermarkSpec& spec) noexcept {
    spec.rotation_degrees = std::clamp(spec.rotation_degrees, kMinRotation, kMaxRotation);

    if (auto* text = std::get_if<TextWatermark>(&spec.payload)) {
        text->font_size = std::clamp(text->font_size, kMinFontSize, kMaxFontSize);
        text->opacity = std::clamp(text->opacity, 0.0f, 1.0f);
    } else if (auto* image = std::get_if<ImageWatermark>(&spec.payload)) {
        image->scale_percent = std::clamp(image->scale_percent, kMinScalePercent, kMaxScalePercent);
        image->opacity = std::clamp(image->opacity, 0.0f, 1.0f);
    }
}

void validate(const ExportSettings& settings) {
    auto fail = [](const std::string& message) {
        throw WatermarkError(ErrorCode::InvalidParameter, message);
    };

    if (settings.output_dir.empty()) {
        fail("Output directory is not set");
    }
    if (settings.jpeg_quality < 1 || settings.jpeg_quality > 100) {
        fail(fmt::format("JPEG quality {} is outside [1, 100]", settings.jpeg_quality));
    }
    if (settings.resize && settings.resize->value <= 0) {
        fail(fmt::format("Resize value must be positive (got {})", settings.resize->value));
    }
    if (settings.preview_limits.max_width <= 0 || settings.preview_limits.max_height <= 0) {
        fail(fmt::format("Preview limits must be positive (got {}x{})",
                         settings.preview_limits.max_width,
                         settings.preview_limits.max_height));
    }
}

}  // namespace pwt
