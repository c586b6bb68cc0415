#pragma once

#include <opencv2/core.hpp>

namespace cs {
    struct SsimParams {
        int win_size = 7;        // odd, >= 3
        double data_range = 255.0;
        double k1 = 0.01;
        double k2 = 0.03;
    };

    // Mean structural similarity of two equal-sized single-channel images, computed
    // with a uniform window and sample covariance, averaged over the interior where
    // the window fits. Range [-1, 1]; identical images score 1.
    // Throws std::invalid_argument on size/channel mismatch or images smaller than the window.
    double ssim(const cv::Mat& a, const cv::Mat& b, const SsimParams& p = {});
}
