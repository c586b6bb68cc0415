#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace cs {
    // Reference image searched for in frames. Immutable after loading.
    struct Template {
        std::string name;
        cv::Mat bgr;
        cv::Mat gray;
        // Factor applied to the source image (<= 1). Frames are scaled by the same
        // factor before matching so the geometry stays comparable.
        double scale = 1.0;

        cv::Size size() const { return gray.size(); }
    };

    // Throws TemplateError if the file is missing, unreadable or zero-sized.
    Template load_template(const std::string& path, int max_width = 0);

    // Same checks as load_template() for an image already in memory.
    Template make_template(const cv::Mat& image, int max_width = 0, std::string name = "template");
}
