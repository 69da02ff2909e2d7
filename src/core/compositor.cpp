/**
 * @file    compositor.cpp
 * @brief   Alpha compositing implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/compositor.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cmath>

namespace pwt {

namespace {

void blend_over(cv::Mat& dst, const cv::Mat& src) {
    for (int y = 0; y < dst.rows; ++y) {
        auto* d = dst.ptr<cv::Vec4b>(y);
        const auto* s = src.ptr<cv::Vec4b>(y);

        for (int x = 0; x < dst.cols; ++x) {
            const int sa = s[x][3];
            if (sa == 0) continue;

            if (sa == 255) {
                d[x] = s[x];
                continue;
            }

            const float a = sa / 255.0f;
            const float da = d[x][3] / 255.0f;
            const float out_a = a + da * (1.0f - a);

            for (int c = 0; c < 3; ++c) {
                const float value = (s[x][c] * a + d[x][c] * da * (1.0f - a)) / out_a;
                d[x][c] = cv::saturate_cast<uchar>(value);
            }
            d[x][3] = cv::saturate_cast<uchar>(out_a * 255.0f);
        }
    }
}

}  // anonymous namespace

cv::Rect clip_to_canvas(cv::Size canvas, cv::Size layer, cv::Point position) noexcept {
    return cv::Rect(position, layer) & cv::Rect(cv::Point(0, 0), canvas);
}

cv::Mat compose(const cv::Mat& base, const cv::Mat& layer, cv::Point position) {
    if (base.type() != CV_8UC4 || layer.type() != CV_8UC4) {
        throw WatermarkError(ErrorCode::InvalidParameter,
                             fmt::format("compose expects 8-bit BGRA inputs (base={}ch, layer={}ch)",
                                         base.channels(), layer.channels()));
    }

    cv::Mat out = base.clone();

    const cv::Rect target = clip_to_canvas(base.size(), layer.size(), position);
    if (target.empty()) {
        spdlog::debug("Layer at ({}, {}) is outside the {}x{} canvas",
                      position.x, position.y, base.cols, base.rows);
        return out;
    }

    const cv::Rect source(target.x - position.x, target.y - position.y,
                          target.width, target.height);

    cv::Mat dst_roi = out(target);
    blend_over(dst_roi, layer(source));

    return out;
}

}  // namespace pwt
