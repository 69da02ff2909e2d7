/**
 * @file    i18n.hpp
 * @brief   Internationalization (i18n) support for Photo Watermark Tool
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Strings live in <lang_dir>/<code>.json as nested objects and are looked
 * up by dot-joined keys ("cli.summary"). Lookup order: current language,
 * English, then the key itself.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <fmt/format.h>

namespace pwt::i18n {

// =============================================================================
// Supported Languages
// =============================================================================

enum class Language {
    English,       // en
    ChineseSimp,   // zh-CN
    Japanese       // ja
};

/**
 * Language code string (e.g., "en", "zh-CN")
 */
const char* language_code(Language lang);

/**
 * Parse a language code ("en", "zh-CN", "ja"); nullopt if unknown
 */
std::optional<Language> parse_language(std::string_view code);

/**
 * Languages with display names
 */
std::vector<std::pair<Language, std::string>> available_languages();

// =============================================================================
// Catalog
// =============================================================================

class Catalog {
public:
    /**
     * Load English plus the requested language
     * @return false if the English file cannot be loaded
     */
    bool load(const std::filesystem::path& lang_dir, Language lang = Language::English);

    /**
     * Switch language; falls back to English if its file is missing
     * @return true if the requested language is now active
     */
    bool set_language(Language lang);

    [[nodiscard]] bool is_loaded() const noexcept { return m_loaded; }
    [[nodiscard]] Language language() const noexcept { return m_current; }
    [[nodiscard]] size_t size() const noexcept { return m_strings.size(); }

    /**
     * Translate a key; returns the key itself when not found
     * The returned pointer stays valid until the next load().
     */
    const char* tr(std::string_view key) const;

private:
    bool m_loaded{false};
    Language m_current{Language::English};
    std::filesystem::path m_lang_dir;
    std::unordered_map<std::string, std::string> m_strings;
    std::unordered_map<std::string, std::string> m_fallback;
    mutable std::unordered_set<std::string> m_missing;
};

// =============================================================================
// Process-wide catalog (used by TR / TRF)
// =============================================================================

Catalog& catalog();

bool init(const std::filesystem::path& lang_dir, Language lang = Language::English);
bool is_initialized();
Language current_language();
bool set_language(Language lang);

const char* tr(std::string_view key);

/**
 * Translate and format a string with arguments
 * A malformed translation falls back to the unformatted text.
 */
template<typename... Args>
std::string trf(std::string_view key, Args&&... args) {
    try {
        return fmt::format(fmt::runtime(tr(key)), std::forward<Args>(args)...);
    } catch (const fmt::format_error&) {
        return std::string(tr(key));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define TR(key) ::pwt::i18n::tr(key)

#define TRF(key, ...) ::pwt::i18n::trf(key, __VA_ARGS__)

}  // namespace pwt::i18n
