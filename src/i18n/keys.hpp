/**
 * @file    keys.hpp
 * @brief   String key definitions for i18n
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * All translatable string keys are defined here as constexpr string_view.
 *
 * Naming convention:
 *   - cli.<context>      : CLI messages
 *   - status.<state>     : Preview / export status messages
 *   - watermark.<item>   : Watermark description lines
 */

#pragma once

#include <string_view>

namespace pwt::i18n::keys {

// =============================================================================
// CLI - Result prefixes
// =============================================================================
constexpr std::string_view CLI_OK = "cli.ok";
constexpr std::string_view CLI_FAIL = "cli.fail";
constexpr std::string_view CLI_ERROR = "cli.error";
constexpr std::string_view CLI_FATAL = "cli.fatal";

// =============================================================================
// CLI - Summary
// =============================================================================
constexpr std::string_view CLI_SUMMARY = "cli.summary";
constexpr std::string_view CLI_EXPORTED = "cli.exported";
constexpr std::string_view CLI_FAILED = "cli.failed";
constexpr std::string_view CLI_TOTAL = "cli.total";

// =============================================================================
// CLI - Errors and hints
// =============================================================================
constexpr std::string_view CLI_NO_IMAGES = "cli.no_images";
constexpr std::string_view CLI_OUTPUT_REQUIRED = "cli.output_required";
constexpr std::string_view CLI_SAME_DIR = "cli.same_dir";
constexpr std::string_view CLI_BAD_COLOR = "cli.bad_color";
constexpr std::string_view CLI_BOTH_RESIZE = "cli.both_resize";
constexpr std::string_view CLI_PATH_HINT = "cli.path_hint";
constexpr std::string_view CLI_NEEDS_FONT_FILE = "cli.needs_font_file";

// =============================================================================
// Status
// =============================================================================
constexpr std::string_view STATUS_LOADED = "status.loaded";
constexpr std::string_view STATUS_LOAD_FAILED = "status.load_failed";
constexpr std::string_view STATUS_PREVIEW_SAVED = "status.preview_saved";
constexpr std::string_view STATUS_PREVIEW_FAILED = "status.preview_failed";
constexpr std::string_view STATUS_EXPORTING = "status.exporting";
constexpr std::string_view STATUS_EXPORT_COMPLETE = "status.export_complete";

// =============================================================================
// Watermark description
// =============================================================================
constexpr std::string_view WATERMARK_TEXT = "watermark.text";
constexpr std::string_view WATERMARK_IMAGE = "watermark.image";
constexpr std::string_view WATERMARK_PLACEMENT = "watermark.placement";

}  // namespace pwt::i18n::keys
