#pragma once

#include <opencv2/core.hpp>

#include <matching/template.hpp>

namespace cs {
    // Confidence policy for normalized correlation scores:
    //   >= 0.9 exact, 0.7-0.9 strong, 0.5-0.7 moderate, < 0.5 reject.
    constexpr double kExactMatch = 0.9;
    constexpr double kDefaultMatchThreshold = 0.8;
    constexpr double kModerateMatch = 0.5;

    struct MatchScore {
        cv::Point location; // top-left of the best match, frame coordinates
        double confidence = 0.0; // [0, 1]
    };

    // Normalized cross-correlation (TM_CCOEFF_NORMED) of two images, both reduced to
    // luminance first. Negative or non-finite correlation is reported as 0. A template
    // larger than the frame scores 0 at (0, 0). Throws std::invalid_argument on empty input.
    MatchScore match(const cv::Mat& frame, const cv::Mat& templ);

    // Scales the frame by templ.scale, matches, and maps the location back to the
    // frame's own resolution.
    MatchScore match(const cv::Mat& frame, const Template& templ);

    // Inclusive: a score equal to the threshold is accepted.
    inline bool accepts(double confidence, double threshold) {
        return confidence >= threshold;
    }

    // True when the match's bottom-left corner sits in the frame's bottom-left quadrant.
    bool in_bottom_left_quadrant(cv::Point top_left, cv::Size templ_size, cv::Size frame_size);
}
