/**
 * @file    path_utils.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * path.string() is ANSI on Windows while fmt/spdlog expect UTF-8, so every
 * path that reaches a log line or console message goes through u8string().
 *
 * Usage:
 *   spdlog::info("Exporting: {}", path);     // formatter below
 *   fmt::print("{}\n", pwt::filename_utf8(path));
 */

#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace pwt {

/**
 * Path as UTF-8 std::string (C++20 u8string() yields char8_t)
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    const auto u8 = path.u8string();
    return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

inline std::string filename_utf8(const std::filesystem::path& path) {
    return to_utf8(path.filename());
}

inline std::string stem_utf8(const std::filesystem::path& path) {
    return to_utf8(path.stem());
}

/**
 * Build a path from UTF-8 text (CLI arguments, config files)
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8) {
    return std::filesystem::path(
        std::u8string(reinterpret_cast<const char8_t*>(utf8.data()), utf8.size()));
}

/**
 * Lower-cased extension including the dot (".jpg"), empty if none
 */
inline std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace pwt

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        const std::string utf8 = pwt::to_utf8(p);
        return fmt::formatter<std::string_view>::format(std::string_view{utf8}, ctx);
    }
};
