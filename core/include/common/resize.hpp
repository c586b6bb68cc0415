#pragma once

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace cs {
    // Factor that brings `width` down to `max_width`. Never upscales; max_width <= 0 disables.
    inline double downscale_factor(int width, int max_width) {
        if (max_width <= 0 || width <= max_width || width <= 0) return 1.0;
        return static_cast<double>(max_width) / static_cast<double>(width);
    }

    inline cv::Mat scale_frame(const cv::Mat& src, double scale, int interp = cv::INTER_AREA) {
        if (src.empty() || scale == 1.0) return src;

        const int new_w = std::max(1, static_cast<int>(std::lround(src.cols * scale)));
        const int new_h = std::max(1, static_cast<int>(std::lround(src.rows * scale)));

        cv::Mat dst;
        cv::resize(src, dst, {new_w, new_h}, 0, 0, interp);
        return dst;
    }

    inline cv::Mat resize_frame(const cv::Mat& src, cv::Size target, int interp = cv::INTER_LINEAR) {
        if (src.empty() || target.width <= 0 || target.height <= 0) return src;
        if (src.size() == target) return src;

        cv::Mat dst;
        cv::resize(src, dst, target, 0, 0, interp);
        return dst;
    }

    inline cv::Mat to_gray(const cv::Mat& src) {
        if (src.empty() || src.channels() == 1) return src;

        cv::Mat gray;
        if (src.channels() == 4) {
            cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY);
        } else {
            cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
        }
        return gray;
    }
}
