/**
 * @file    offset_translator.cpp
 * @brief   Pixel <-> ratio offset translation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/offset_translator.hpp"

#include <cmath>

namespace pwt {

RatioOffset to_ratio(PixelOffset offset, cv::Size canvas) noexcept {
    RatioOffset ratio;
    if (canvas.width > 0) {
        ratio.rx = static_cast<double>(offset.dx) / canvas.width;
    }
    if (canvas.height > 0) {
        ratio.ry = static_cast<double>(offset.dy) / canvas.height;
    }
    return ratio;
}

PixelOffset to_pixels(RatioOffset offset, cv::Size canvas) noexcept {
    return PixelOffset{
        static_cast<int>(std::lround(offset.rx * canvas.width)),
        static_cast<int>(std::lround(offset.ry * canvas.height))
    };
}

PixelOffset resolve_offset(const PlacementOffset& offset, cv::Size canvas) noexcept {
    if (const auto* ratio = std::get_if<RatioOffset>(&offset)) {
        return to_pixels(*ratio, canvas);
    }
    return std::get<PixelOffset>(offset);
}

RatioOffset capture_ratio(const PlacementOffset& offset, cv::Size canvas) noexcept {
    if (const auto* pixels = std::get_if<PixelOffset>(&offset)) {
        return to_ratio(*pixels, canvas);
    }
    return std::get<RatioOffset>(offset);
}

}  // namespace pwt
