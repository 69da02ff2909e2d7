/**
 * @file    truetype_font.cpp
 * @brief   TrueType/OpenType text rasterisation implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/truetype_font.hpp"
#include "core/types.hpp"
#include "utils/path_utils.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iterator>

namespace pwt {

namespace {

constexpr char32_t kReplacement = U'\uFFFD';

// 26.6 fixed point to whole pixels, rounding outwards
int ceil_26_6(FT_Pos value) {
    return static_cast<int>((value + 63) >> 6);
}

std::vector<unsigned char> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("Cannot open font file: {}", to_utf8(path)));
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

}  // anonymous namespace

// =============================================================================
// UTF-8
// =============================================================================

std::u32string decode_utf8(std::string_view text) {
    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);

        int extra = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            result.push_back(kReplacement);
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            // Truncated sequence at the end of the input
            result.push_back(kReplacement);
            ++i;
            continue;
        }

        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (next & 0x3F);
        }

        if (!valid || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            result.push_back(kReplacement);
            ++i;
            continue;
        }

        result.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return result;
}

bool is_ascii(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

// =============================================================================
// TrueTypeFont
// =============================================================================

void TrueTypeFont::LibraryDeleter::operator()(FT_LibraryRec_* library) const noexcept {
    FT_Done_FreeType(library);
}

void TrueTypeFont::FaceDeleter::operator()(FT_FaceRec_* face) const noexcept {
    FT_Done_Face(face);
}

TrueTypeFont::TrueTypeFont(const std::filesystem::path& path, int pixel_size)
    : m_data(read_file(path))
    , m_pixel_size(pixel_size) {
    FT_Library library = nullptr;
    if (const FT_Error error = FT_Init_FreeType(&library); error != 0) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("FreeType initialisation failed (error {})", error));
    }
    m_library.reset(library);

    FT_Face face = nullptr;
    const FT_Error error = FT_New_Memory_Face(
        library, m_data.data(), static_cast<FT_Long>(m_data.size()), 0, &face);
    if (error != 0) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("Not a usable font file: {} (error {})",
                                         to_utf8(path), error));
    }
    m_face.reset(face);

    if (const FT_Error size_error = FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixel_size));
        size_error != 0) {
        throw WatermarkError(ErrorCode::LoadFailure,
                             fmt::format("Font {} cannot be scaled to {}px (error {})",
                                         to_utf8(path), pixel_size, size_error));
    }

    const FT_Size_Metrics& metrics = face->size->metrics;
    m_ascent = ceil_26_6(metrics.ascender);
    m_descent = ceil_26_6(-metrics.descender);
    m_line_height = std::max(m_ascent + m_descent, ceil_26_6(metrics.height));
    m_family = face->family_name ? face->family_name : "unknown";

    spdlog::debug("Font file {} ({}) @ {}px: ascent={} descent={} line={}px",
                  path, m_family, pixel_size, m_ascent, m_descent, m_line_height);
}

TrueTypeFont::~TrueTypeFont() = default;

template <typename Visit>
void TrueTypeFont::layout(std::string_view utf8_line, Visit&& visit) {
    FT_Face face = m_face.get();
    const bool kerning = FT_HAS_KERNING(face);

    int pen_x = 0;
    FT_UInt previous = 0;
    for (const char32_t cp : decode_utf8(utf8_line)) {
        const FT_UInt index = FT_Get_Char_Index(face, cp);

        if (kerning && previous != 0 && index != 0) {
            FT_Vector delta{};
            if (FT_Get_Kerning(face, previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                pen_x += static_cast<int>(delta.x >> 6);
            }
        }

        if (FT_Load_Glyph(face, index, FT_LOAD_RENDER | FT_LOAD_NO_BITMAP) != 0) {
            spdlog::debug("No glyph for U+{:04X} in {}", static_cast<unsigned>(cp), m_family);
            previous = 0;
            continue;
        }

        const FT_GlyphSlot slot = face->glyph;
        if (slot->bitmap.pixel_mode == FT_PIXEL_MODE_GRAY &&
            slot->bitmap.width > 0 && slot->bitmap.rows > 0) {
            visit(slot->bitmap, pen_x + slot->bitmap_left, -slot->bitmap_top);
        }

        pen_x += static_cast<int>(slot->advance.x >> 6);
        previous = index;
    }
}

cv::Rect TrueTypeFont::ink_bounds(std::string_view utf8_line) {
    cv::Rect bounds;
    layout(utf8_line, [&](const FT_Bitmap& bitmap, int left, int top) {
        const cv::Rect glyph(left, top, static_cast<int>(bitmap.width), static_cast<int>(bitmap.rows));
        bounds = bounds.empty() ? glyph : (bounds | glyph);
    });
    return bounds;
}

void TrueTypeFont::draw(cv::Mat& coverage, std::string_view utf8_line, cv::Point origin) {
    if (coverage.type() != CV_8UC1) {
        throw WatermarkError(ErrorCode::InvalidParameter, "Text coverage mask must be CV_8UC1");
    }

    layout(utf8_line, [&](const FT_Bitmap& bitmap, int left, int top) {
        const int x0 = origin.x + left;
        const int y0 = origin.y + top;

        for (int r = 0; r < static_cast<int>(bitmap.rows); ++r) {
            const int y = y0 + r;
            if (y < 0 || y >= coverage.rows) continue;

            const unsigned char* src = bitmap.buffer + static_cast<std::ptrdiff_t>(r) * bitmap.pitch;
            auto* dst = coverage.ptr<uchar>(y);
            for (int c = 0; c < static_cast<int>(bitmap.width); ++c) {
                const int x = x0 + c;
                if (x < 0 || x >= coverage.cols) continue;
                dst[x] = std::max(dst[x], src[c]);
            }
        }
    });
}

}  // namespace pwt
