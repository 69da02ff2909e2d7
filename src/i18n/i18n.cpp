/**
 * @file    i18n.cpp
 * @brief   i18n implementation - JSON loading and string lookup
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "i18n/i18n.hpp"
#include "utils/path_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace pwt::i18n {

namespace {

using StringTable = std::unordered_map<std::string, std::string>;

/**
 * Flatten nested JSON to dot-notation keys
 * e.g., {"cli": {"ok": "[OK] "}} -> {"cli.ok": "[OK] "}
 */
void flatten(const nlohmann::json& node, const std::string& prefix, StringTable& out) {
    for (const auto& [key, value] : node.items()) {
        if (prefix.empty() && key == "meta") continue;

        const std::string full_key = prefix.empty() ? key : prefix + "." + key;
        if (value.is_object()) {
            flatten(value, full_key, out);
        } else if (value.is_string()) {
            out[full_key] = value.get<std::string>();
        }
    }
}

bool load_table(const std::filesystem::path& path, StringTable& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("[i18n] Language file not found: {}", path);
        return false;
    }

    try {
        const nlohmann::json root = nlohmann::json::parse(file);
        StringTable table;
        flatten(root, "", table);
        out = std::move(table);
        spdlog::debug("[i18n] Loaded {} strings from {}", out.size(), path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[i18n] JSON error in {}: {}", path, e.what());
        return false;
    }
}

}  // anonymous namespace

// =============================================================================
// Languages
// =============================================================================

const char* language_code(Language lang) {
    switch (lang) {
        case Language::English:     return "en";
        case Language::ChineseSimp: return "zh-CN";
        case Language::Japanese:    return "ja";
    }
    return "en";
}

std::optional<Language> parse_language(std::string_view code) {
    for (const auto& [lang, name] : available_languages()) {
        if (code == language_code(lang)) {
            return lang;
        }
    }
    return std::nullopt;
}

std::vector<std::pair<Language, std::string>> available_languages() {
    return {
        {Language::English,     "English"},
        {Language::ChineseSimp, "简体中文"},
        {Language::Japanese,    "日本語"}
    };
}

// =============================================================================
// Catalog
// =============================================================================

bool Catalog::load(const std::filesystem::path& lang_dir, Language lang) {
    m_lang_dir = lang_dir;
    m_loaded = false;
    m_missing.clear();

    if (!load_table(lang_dir / "en.json", m_fallback)) {
        spdlog::error("[i18n] Failed to load English strings from {}", lang_dir);
        m_fallback.clear();
        m_strings.clear();
        return false;
    }

    m_loaded = true;
    m_strings = m_fallback;
    m_current = Language::English;

    if (lang == Language::English) {
        spdlog::debug("[i18n] Initialized with English");
        return true;
    }
    return set_language(lang);
}

bool Catalog::set_language(Language lang) {
    if (!m_loaded) {
        spdlog::warn("[i18n] Not initialized, cannot switch language");
        return false;
    }

    if (lang == Language::English) {
        m_strings = m_fallback;
        m_current = lang;
        return true;
    }

    const auto path = m_lang_dir / (std::string(language_code(lang)) + ".json");
    if (load_table(path, m_strings)) {
        m_current = lang;
        spdlog::debug("[i18n] Switched to {}", language_code(lang));
        return true;
    }

    spdlog::warn("[i18n] Falling back to English (no {} strings)", language_code(lang));
    m_strings = m_fallback;
    m_current = Language::English;
    return false;
}

const char* Catalog::tr(std::string_view key) const {
    const std::string k(key);

    if (auto it = m_strings.find(k); it != m_strings.end()) {
        return it->second.c_str();
    }
    if (auto it = m_fallback.find(k); it != m_fallback.end()) {
        return it->second.c_str();
    }

    // Unknown keys echo back so missing translations are visible
    return m_missing.insert(k).first->c_str();
}

// =============================================================================
// Process-wide catalog
// =============================================================================

Catalog& catalog() {
    static Catalog instance;
    return instance;
}

bool init(const std::filesystem::path& lang_dir, Language lang) {
    return catalog().load(lang_dir, lang);
}

bool is_initialized() {
    return catalog().is_loaded();
}

Language current_language() {
    return catalog().language();
}

bool set_language(Language lang) {
    return catalog().set_language(lang);
}

const char* tr(std::string_view key) {
    return catalog().tr(key);
}

}  // namespace pwt::i18n
