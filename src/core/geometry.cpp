/**
 * @file    geometry.cpp
 * @brief   Watermark placement geometry implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/geometry.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pwt {

namespace {

// Floor division, so a layer wider than the canvas centers consistently
constexpr int floor_half(int value) noexcept {
    return (value >= 0) ? value / 2 : -((-value + 1) / 2);
}

int truncate_scaled(int value, double ratio) noexcept {
    return std::max(1, static_cast<int>(value * ratio));
}

}  // anonymous namespace

cv::Point resolve_anchor(cv::Size canvas, cv::Size layer, Anchor anchor) noexcept {
    const int left   = kAnchorMargin;
    const int center = floor_half(canvas.width - layer.width);
    const int right  = canvas.width - layer.width - kAnchorMargin;
    const int top    = kAnchorMargin;
    const int middle = floor_half(canvas.height - layer.height);
    const int bottom = canvas.height - layer.height - kAnchorMargin;

    switch (anchor) {
        case Anchor::TopLeft:      return {left, top};
        case Anchor::TopCenter:    return {center, top};
        case Anchor::TopRight:     return {right, top};
        case Anchor::MiddleLeft:   return {left, middle};
        case Anchor::Center:       return {center, middle};
        case Anchor::MiddleRight:  return {right, middle};
        case Anchor::BottomLeft:   return {left, bottom};
        case Anchor::BottomCenter: return {center, bottom};
        case Anchor::BottomRight:
        default:                   return {right, bottom};
    }
}

cv::Point resolve_position(cv::Size canvas, cv::Size layer,
                           Anchor anchor, PixelOffset offset) noexcept {
    const cv::Point base = resolve_anchor(canvas, layer, anchor);
    return {base.x + offset.dx, base.y + offset.dy};
}

double fit_scale(cv::Size size, const PreviewLimits& limits) noexcept {
    if (size.width <= 0 || size.height <= 0) {
        return 1.0;
    }
    return std::min({
        static_cast<double>(limits.max_width) / size.width,
        static_cast<double>(limits.max_height) / size.height,
        1.0
    });
}

cv::Size fit_within(cv::Size size, const PreviewLimits& limits) noexcept {
    const double scale = fit_scale(size, limits);
    if (scale >= 1.0) {
        return size;
    }
    return {truncate_scaled(size.width, scale), truncate_scaled(size.height, scale)};
}

cv::Size resize_target(cv::Size size, const ResizeSpec& resize) {
    if (resize.value <= 0) {
        throw WatermarkError(ErrorCode::InvalidParameter,
                             fmt::format("Resize value must be positive (got {})", resize.value));
    }

    const long long v = resize.value;
    const long long w = size.width;
    const long long h = size.height;
    auto at_least_one = [](long long value) {
        return static_cast<int>(std::max(1LL, value));
    };

    switch (resize.mode) {
        case ResizeMode::Width:
            return {resize.value, at_least_one(w > 0 ? h * v / w : 0)};
        case ResizeMode::Height:
            return {at_least_one(h > 0 ? w * v / h : 0), resize.value};
        case ResizeMode::Percent:
        default:
            return {at_least_one(w * v / 100), at_least_one(h * v / 100)};
    }
}

}  // namespace pwt
