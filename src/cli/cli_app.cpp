/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line interface for Photo Watermark Tool.
 *
 * The first input drives a preview session (exactly what a preview
 * surface would show). The approved placement is then applied to every
 * input by the batch exporter.
 *
 *   pwt -i photos/ -o out/ --text "(c) 2024" --anchor bottom-right
 *   pwt -i a.jpg --image logo.png --scale 25 --preview check.png
 *   pwt -i photos/ -o out/ --text "© 张三" --font-file NotoSansSC-Regular.otf
 */

// Must be defined before any Windows headers
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include "cli/cli_app.hpp"
#include "core/batch_exporter.hpp"
#include "core/image_io.hpp"
#include "core/layer_renderer.hpp"
#include "core/preview_session.hpp"
#include "core/truetype_font.hpp"
#include "core/watermark_engine.hpp"
#include "utils/ascii_logo.hpp"
#include "utils/path_utils.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <cmath>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// TTY detection (cross-platform)
#ifdef _WIN32
    #include <io.h>
    #include <windows.h>
    #ifndef STDOUT_FILENO
        #define STDOUT_FILENO 1
    #endif
    #define isatty _isatty
#elif __APPLE__
    #include <unistd.h>
    #include <mach-o/dyld.h>
#else
    #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace pwt::cli {

namespace {

// =============================================================================
// i18n Initialization
// =============================================================================

// Get executable directory (cross-platform)
fs::path get_executable_dir() {
#ifdef _WIN32
    wchar_t path[MAX_PATH];
    GetModuleFileNameW(nullptr, path, MAX_PATH);
    return fs::path(path).parent_path();
#elif __APPLE__
    char path[1024];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        return fs::canonical(path).parent_path();
    }
    return fs::current_path();
#else
    std::error_code ec;
    auto exe = fs::canonical("/proc/self/exe", ec);
    return ec ? fs::current_path() : exe.parent_path();
#endif
}

// Find language directory relative to executable
fs::path find_lang_dir() {
    // 1. Executable directory (release builds)
    const auto exe_dir = get_executable_dir();
    if (fs::exists(exe_dir / "lang" / "en.json")) {
        return exe_dir / "lang";
    }

    // 2. Current working directory (development)
    const auto cwd = fs::current_path();
    if (fs::exists(cwd / "lang" / "en.json")) {
        return cwd / "lang";
    }

    // 3. Project root
    if (fs::exists(cwd / "resources" / "lang" / "en.json")) {
        return cwd / "resources" / "lang";
    }

#ifdef __linux__
    // 4. System install location
    if (fs::exists("/usr/share/photo-watermark-tool/lang/en.json")) {
        return "/usr/share/photo-watermark-tool/lang";
    }
#endif

    return exe_dir / "lang";
}

// =============================================================================
// TTY Detection
// =============================================================================

/**
 * Check if stdout is connected to a terminal (TTY).
 * Returns false when output is piped or redirected.
 */
bool is_terminal() noexcept {
    return isatty(STDOUT_FILENO) != 0;
}

// =============================================================================
// Banner printing
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "{}", pwt::ASCII_BANNER);
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", APP_VERSION);
    fmt::print("\n");
}

void print_compact_logo() {
    fmt::print(fmt::fg(fmt::color::cyan), "{}", pwt::ASCII_COMPACT);
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", APP_VERSION);
}

/**
 * Parse --banner / --no-banner from argv before CLI11 parsing.
 * Returns: std::nullopt (use auto), true (force show), false (force hide)
 */
std::optional<bool> parse_banner_flag(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--banner") return true;
        if (arg == "--no-banner") return false;
    }
    return std::nullopt;
}

/**
 * Priority: --banner/--no-banner flag > TTY auto-detection
 */
bool should_show_banner(std::optional<bool> flag_override) {
    if (flag_override.has_value()) {
        return flag_override.value();
    }
    return is_terminal();
}

// =============================================================================
// Option tables
// =============================================================================

std::vector<std::string> anchor_names() {
    return {"top-left",    "top-center",    "top-right",
            "middle-left", "center",        "middle-right",
            "bottom-left", "bottom-center", "bottom-right"};
}

std::vector<std::string> font_names() {
    return {"sans", "sans-bold", "serif", "serif-bold", "script", "plain",
            "sans-italic", "serif-italic", "serif-bold-italic", "script-italic"};
}

const std::map<std::string, OutputFormat> kFormats = {
    {"png", OutputFormat::Png}, {"jpeg", OutputFormat::Jpeg}, {"jpg", OutputFormat::Jpeg}
};

const std::map<std::string, NamingRule> kNamingRules = {
    {"keep", NamingRule::Keep}, {"prefix", NamingRule::Prefix}, {"suffix", NamingRule::Suffix}
};

const std::map<std::string, ResizeMode> kResizeModes = {
    {"width", ResizeMode::Width}, {"height", ResizeMode::Height}, {"percent", ResizeMode::Percent}
};

// =============================================================================
// Reporting
// =============================================================================

int percent(float opacity) {
    return static_cast<int>(std::lround(opacity * 100.0f));
}

void describe(const WatermarkSpec& spec) {
    if (const auto* text = std::get_if<TextWatermark>(&spec.payload)) {
        fmt::print(fmt::fg(fmt::color::gray), "{}\n",
                   TRF(i18n::keys::WATERMARK_TEXT, text->content, text->font_size, percent(text->opacity)));
    } else if (const auto* image = std::get_if<ImageWatermark>(&spec.payload)) {
        fmt::print(fmt::fg(fmt::color::gray), "{}\n",
                   TRF(i18n::keys::WATERMARK_IMAGE, filename_utf8(image->source),
                       image->scale_percent, percent(image->opacity)));
    }

    const auto* pixels = std::get_if<PixelOffset>(&spec.offset);
    fmt::print(fmt::fg(fmt::color::gray), "{}\n\n",
               TRF(i18n::keys::WATERMARK_PLACEMENT, to_string(spec.anchor),
                   pixels ? pixels->dx : 0, pixels ? pixels->dy : 0, spec.rotation_degrees));
}

void print_item(const ExportItemResult& item) {
    if (item.success) {
        fmt::print(fmt::fg(fmt::color::green), "{}", TR(i18n::keys::CLI_OK));
        fmt::print("{} -> {}\n", filename_utf8(item.source), filename_utf8(item.output));
    } else {
        fmt::print(fmt::fg(fmt::color::red), "{}", TR(i18n::keys::CLI_FAIL));
        fmt::print("{}: {}\n", filename_utf8(item.source), item.message);
    }
}

void print_summary(const BatchResult& result) {
    if (result.total() > 1) {
        fmt::print("\n");
        fmt::print(fmt::fg(fmt::color::green), "{}", TR(i18n::keys::CLI_SUMMARY));
        fmt::print("{}", TRF(i18n::keys::CLI_EXPORTED, result.success));
        if (result.failed > 0) {
            fmt::print(fmt::fg(fmt::color::red), "{}", TRF(i18n::keys::CLI_FAILED, result.failed));
        }
        fmt::print("{}\n", TRF(i18n::keys::CLI_TOTAL, result.total()));
    }
}

void print_error(const std::string& message) {
    fmt::print(fmt::fg(fmt::color::red), "{}", TR(i18n::keys::CLI_ERROR));
    fmt::print("{}\n", message);
}

/**
 * Source whose directory equals the output directory, if any
 */
std::optional<fs::path> find_same_dir_source(const std::vector<fs::path>& sources,
                                             const fs::path& output_dir) {
    std::error_code ec;
    const auto out = fs::weakly_canonical(output_dir, ec);
    if (ec) return std::nullopt;

    for (const auto& source : sources) {
        const auto parent = fs::weakly_canonical(source, ec).parent_path();
        if (!ec && parent == out) {
            return source;
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    i18n::init(find_lang_dir(), i18n::Language::English);

    // Check banner preference before CLI11 parsing
    auto banner_flag = parse_banner_flag(argc, argv);

    CLI::App app{"Photo Watermark Tool - Add text or image watermarks to photos"};
    app.footer("\nExample: pwt -i photos/ -o out/ --text \"(c) 2024\" --anchor bottom-right");

    app.set_version_flag("-V,--version", APP_VERSION);
    app.set_config("--config", "", "Read options from an INI/TOML file");

    bool banner_show = false;
    bool banner_hide = false;
    app.add_flag("--banner", banner_show,
                 "Show ASCII banner (default: auto-detect based on TTY)");
    app.add_flag("--no-banner", banner_hide,
                 "Hide ASCII banner (useful for scripts)");

    // Input/Output paths
    std::vector<std::string> input_paths;
    std::string output_path;
    std::string preview_path;

    app.add_option("-i,--input", input_paths, "Input image files or directories")
        ->required();
        // Existence is checked by collect_images for clearer messages
    app.add_option("-o,--output", output_path, "Output directory");
    app.add_option("--preview", preview_path,
                   "Write the preview composition of the first input to this file and exit");

    // Text watermark
    WatermarkSpec spec;
    TextWatermark text;
    ImageWatermark image;
    std::string color_text = "white";
    std::string anchor_text = "bottom-right";
    std::string image_path;
    std::string font_file;

    auto* text_opt = app.add_option("--text", text.content, "Text watermark content")
        ->group("Watermark");
    app.add_option("--font", text.font, "Font family")
        ->check(CLI::IsMember(font_names()))
        ->capture_default_str()->group("Watermark");
    app.add_option("--font-file", font_file,
                   "TrueType/OpenType font file (required for non-ASCII text)")
        ->check(CLI::ExistingFile)->group("Watermark");
    app.add_option("--font-size", text.font_size, "Font size in pixels")
        ->check(CLI::Range(kMinFontSize, kMaxFontSize))
        ->capture_default_str()->group("Watermark");
    app.add_option("--color", color_text, "Text color (#RRGGBB, R,G,B or a name)")
        ->capture_default_str()->group("Watermark");

    float opacity = -1.0f;
    app.add_option("--opacity", opacity, "Watermark opacity (0.0-1.0)")
        ->check(CLI::Range(0.0f, 1.0f))->group("Watermark");

    // Image watermark
    auto* image_opt = app.add_option("--image", image_path, "Image watermark file (PNG with alpha)")
        ->group("Watermark");
    app.add_option("--scale", image.scale_percent, "Image watermark width, percent of the photo width")
        ->check(CLI::Range(kMinScalePercent, kMaxScalePercent))
        ->capture_default_str()->group("Watermark");
    text_opt->excludes(image_opt);

    // Placement
    std::vector<int> offset;
    app.add_option("--anchor", anchor_text, "Anchor position")
        ->check(CLI::IsMember(anchor_names()))
        ->capture_default_str()->group("Placement");
    app.add_option("--offset", offset, "Offset from the anchor in preview pixels (dx,dy)")
        ->expected(2)->delimiter(',')->group("Placement");
    app.add_option("--rotation", spec.rotation_degrees, "Rotation in degrees (counter-clockwise)")
        ->check(CLI::Range(kMinRotation, kMaxRotation))
        ->capture_default_str()->group("Placement");

    // Export
    ExportSettings settings;
    std::string format_text = "png";
    std::string naming_text = "keep";
    std::string resize_mode_text;
    int resize_value = 0;
    bool original_size = false;

    app.add_option("--format", format_text, "Output format")
        ->check(CLI::IsMember({"png", "jpeg", "jpg"}))
        ->capture_default_str()->group("Export");
    app.add_option("--quality", settings.jpeg_quality, "JPEG quality (1-100)")
        ->check(CLI::Range(1, 100))
        ->capture_default_str()->group("Export");
    app.add_option("--naming", naming_text, "Naming rule")
        ->check(CLI::IsMember({"keep", "prefix", "suffix"}))
        ->capture_default_str()->group("Export");
    app.add_option("--prefix", settings.prefix, "Prefix for the prefix naming rule")
        ->capture_default_str()->group("Export");
    app.add_option("--suffix", settings.suffix, "Suffix for the suffix naming rule")
        ->capture_default_str()->group("Export");
    auto* resize_mode_opt = app.add_option("--resize-mode", resize_mode_text, "Resize mode")
        ->check(CLI::IsMember({"width", "height", "percent"}))->group("Export");
    auto* resize_value_opt = app.add_option("--resize-value", resize_value,
                                            "Target width/height in pixels, or percent")
        ->check(CLI::PositiveNumber)->group("Export");
    app.add_flag("--original-size", original_size,
                 "Compose at the original resolution instead of the preview size")
        ->group("Export");

    // Misc
    std::string lang_code = "en";
    app.add_option("--lang", lang_code, "Message language")
        ->check(CLI::IsMember({"en", "zh-CN", "ja"}))
        ->capture_default_str();

    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    // Print banner after parsing (so --help doesn't show banner)
    if (should_show_banner(banner_flag)) {
        print_banner();
    } else if (!quiet && verbose) {
        print_compact_logo();
    }

    // Configure logging
    auto logger = spdlog::stdout_color_mt("pwt");
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (auto lang = i18n::parse_language(lang_code); lang) {
        i18n::set_language(*lang);
    }

    // Assemble the watermark
    auto color = parse_color(color_text);
    if (!color) {
        print_error(TRF(i18n::keys::CLI_BAD_COLOR, color_text));
        return 1;
    }
    text.color = *color;

    if (!font_file.empty()) {
        text.font_file = path_from_utf8(font_file);
    } else if (image_path.empty() && !is_ascii(text.content)) {
        // Built-in fonts would draw '?' for every such character
        print_error(TR(i18n::keys::CLI_NEEDS_FONT_FILE));
        return 1;
    }

    if (!image_path.empty()) {
        image.source = path_from_utf8(image_path);
        if (opacity >= 0.0f) image.opacity = opacity;
        spec.payload = image;
    } else {
        if (opacity >= 0.0f) text.opacity = opacity;
        spec.payload = text;
    }

    spec.anchor = parse_anchor(anchor_text);
    if (offset.size() == 2) {
        spec.offset = PixelOffset{offset[0], offset[1]};
    }

    // Assemble export settings
    settings.format = kFormats.at(format_text);
    settings.naming = kNamingRules.at(naming_text);
    settings.canvas = original_size ? ExportCanvas::Original : ExportCanvas::Preview;

    if (resize_mode_opt->count() != resize_value_opt->count()) {
        print_error(TR(i18n::keys::CLI_BOTH_RESIZE));
        return 1;
    }
    if (resize_mode_opt->count() > 0) {
        settings.resize = ResizeSpec{kResizeModes.at(resize_mode_text), resize_value};
    }

    try {
        std::vector<fs::path> inputs;
        inputs.reserve(input_paths.size());
        for (const auto& p : input_paths) {
            inputs.push_back(path_from_utf8(p));
        }

        const auto sources = collect_images(inputs);
        if (sources.empty()) {
            print_error(TR(i18n::keys::CLI_NO_IMAGES));
            fmt::print(fmt::fg(fmt::color::gray), "  {}\n", TR(i18n::keys::CLI_PATH_HINT));
            return 1;
        }

        LayerRenderer renderer;
        WatermarkEngine engine(renderer);

        // Preview of the first input fixes the placement
        PreviewSession session(engine, settings.preview_limits);
        session.set_spec(spec);

        if (session.load_image(sources.front())) {
            session.update_if_needed();
            const auto& canvas = session.canvas();
            spdlog::info("{}", TRF(i18n::keys::STATUS_LOADED,
                                   session.original_size().width, session.original_size().height,
                                   canvas.cols, canvas.rows));
        } else {
            spdlog::error("{}", TRF(i18n::keys::STATUS_LOAD_FAILED, session.error_message()));
        }

        if (!preview_path.empty()) {
            if (!session.has_image()) {
                return 1;
            }
            if (!session.error_message().empty()) {
                print_error(TRF(i18n::keys::STATUS_PREVIEW_FAILED, session.error_message()));
                return 1;
            }
            try {
                const auto target = path_from_utf8(preview_path);
                const auto format = lowercase_extension(target) == ".png" ? OutputFormat::Png
                                                                          : OutputFormat::Jpeg;
                write_image(target, session.composed(), format, settings.jpeg_quality);
                fmt::print(fmt::fg(fmt::color::green), "{}\n",
                           TRF(i18n::keys::STATUS_PREVIEW_SAVED, to_utf8(target)));
                return 0;
            } catch (const WatermarkError& e) {
                print_error(TRF(i18n::keys::STATUS_PREVIEW_FAILED, e.what()));
                return 1;
            }
        }

        if (output_path.empty()) {
            print_error(TR(i18n::keys::CLI_OUTPUT_REQUIRED));
            return 1;
        }
        settings.output_dir = path_from_utf8(output_path);

        if (auto clash = find_same_dir_source(sources, settings.output_dir); clash) {
            print_error(TRF(i18n::keys::CLI_SAME_DIR, to_utf8(clash->parent_path())));
            return 1;
        }

        // Placement measured on the first preview travels as a ratio
        const WatermarkSpec batch_spec = session.has_image() ? session.export_spec() : spec;

        if (!quiet) {
            describe(spec);
        }
        spdlog::info("{}", TRF(i18n::keys::STATUS_EXPORTING, sources.size(),
                               to_utf8(settings.output_dir)));

        BatchExporter exporter(engine);
        const auto result = exporter.export_batch(sources, batch_spec, settings, print_item);

        print_summary(result);
        spdlog::info("{}", TRF(i18n::keys::STATUS_EXPORT_COMPLETE,
                               result.success, result.failed, result.total()));

        return (result.failed > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        fmt::print(fmt::fg(fmt::color::red), "{}{}\n", TR(i18n::keys::CLI_FATAL), e.what());
        return 1;
    }
}

}  // namespace pwt::cli
