#include <matching/template.hpp>

#include <common/errors.hpp>
#include <common/log.hpp>
#include <common/resize.hpp>

#include <filesystem>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace cs {
    Template make_template(const cv::Mat& image, int max_width, std::string name) {
        if (image.empty() || image.cols <= 0 || image.rows <= 0) {
            throw TemplateError("template " + name + " is empty (zero width or height)");
        }
        if (image.depth() != CV_8U) {
            throw TemplateError("template " + name + " must be an 8-bit image");
        }

        Template t;
        t.name = std::move(name);
        t.scale = downscale_factor(image.cols, max_width);

        cv::Mat bgr;
        if (image.channels() == 1) {
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
        } else if (image.channels() == 4) {
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
        } else {
            bgr = image.clone();
        }

        t.bgr = scale_frame(bgr, t.scale);
        t.gray = to_gray(t.bgr);

        if (t.scale != 1.0) {
            CS_LOG(LogLevel::Info, "[Template](make) " << t.name << " downscaled "
                   << image.cols << "x" << image.rows << " -> "
                   << t.gray.cols << "x" << t.gray.rows);
        }
        return t;
    }

    Template load_template(const std::string& path, int max_width) {
        if (path.empty()) {
            throw TemplateError("template path is empty");
        }
        if (!std::filesystem::exists(path)) {
            throw TemplateError("template not found: " + path);
        }

        cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw TemplateError("template unreadable: " + path);
        }
        return make_template(image, max_width, path);
    }
}
