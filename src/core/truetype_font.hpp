/**
 * @file    truetype_font.hpp
 * @brief   TrueType/OpenType text rasterisation (FreeType)
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Loads a font file at one pixel size and draws UTF-8 lines into an
 * 8-bit coverage mask. Used for text the Hershey fonts cannot draw.
 *
 * Glyphs are placed by their advance plus pair kerning. No shaping:
 * scripts that need ligatures or reordering are drawn glyph by glyph.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// FreeType handle types (FT_Library / FT_Face point to these)
struct FT_LibraryRec_;
struct FT_FaceRec_;

namespace pwt {

/**
 * Decode UTF-8; malformed or truncated sequences become U+FFFD
 */
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

/**
 * True when every byte is 7-bit ASCII
 */
[[nodiscard]] bool is_ascii(std::string_view text) noexcept;

class TrueTypeFont {
public:
    /**
     * @param path        Font file (.ttf / .otf / .ttc, first face)
     * @param pixel_size  Nominal em height in pixels
     * @throws WatermarkError(LoadFailure) if the file is missing or not a font
     */
    TrueTypeFont(const std::filesystem::path& path, int pixel_size);
    ~TrueTypeFont();

    TrueTypeFont(const TrueTypeFont&) = delete;
    TrueTypeFont& operator=(const TrueTypeFont&) = delete;

    [[nodiscard]] int pixel_size() const noexcept { return m_pixel_size; }
    [[nodiscard]] int ascent() const noexcept { return m_ascent; }
    [[nodiscard]] int descent() const noexcept { return m_descent; }
    [[nodiscard]] int line_height() const noexcept { return m_line_height; }
    [[nodiscard]] const std::string& family() const noexcept { return m_family; }

    /**
     * Ink bounds of a line relative to its pen origin on the baseline
     *
     * y grows downwards, so glyph tops are negative. Empty when the
     * line has no visible glyphs.
     */
    [[nodiscard]] cv::Rect ink_bounds(std::string_view utf8_line);

    /**
     * Draw a line into a CV_8UC1 mask (max blend, clipped to the mask)
     *
     * @param origin  Pen origin on the baseline
     */
    void draw(cv::Mat& coverage, std::string_view utf8_line, cv::Point origin);

private:
    struct LibraryDeleter {
        void operator()(FT_LibraryRec_* library) const noexcept;
    };
    struct FaceDeleter {
        void operator()(FT_FaceRec_* face) const noexcept;
    };

    template <typename Visit>
    void layout(std::string_view utf8_line, Visit&& visit);

    // Face data must outlive the face; the face must go before the library
    std::vector<unsigned char> m_data;
    std::unique_ptr<FT_LibraryRec_, LibraryDeleter> m_library;
    std::unique_ptr<FT_FaceRec_, FaceDeleter> m_face;

    int m_pixel_size{0};
    int m_ascent{0};
    int m_descent{0};
    int m_line_height{0};
    std::string m_family;
};

}  // namespace pwt
