#include <matching/visual_matcher.hpp>

#include <common/resize.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace cs {
    MatchScore match(const cv::Mat& frame, const cv::Mat& templ) {
        if (frame.empty()) throw std::invalid_argument("match: frame is empty");
        if (templ.empty()) throw std::invalid_argument("match: template is empty");

        MatchScore out;
        if (templ.cols > frame.cols || templ.rows > frame.rows) return out;

        const cv::Mat frame_gray = to_gray(frame);
        const cv::Mat templ_gray = to_gray(templ);

        cv::Mat result;
        cv::matchTemplate(frame_gray, templ_gray, result, cv::TM_CCOEFF_NORMED);
        // flat windows can divide by zero
        cv::patchNaNs(result, 0.0);

        double min_val = 0.0, max_val = 0.0;
        cv::Point min_loc, max_loc;
        cv::minMaxLoc(result, &min_val, &max_val, &min_loc, &max_loc);

        out.location = max_loc;
        out.confidence = std::isfinite(max_val) ? std::clamp(max_val, 0.0, 1.0) : 0.0;
        return out;
    }

    MatchScore match(const cv::Mat& frame, const Template& templ) {
        if (templ.scale == 1.0) return match(frame, templ.gray);

        MatchScore s = match(scale_frame(frame, templ.scale), templ.gray);
        s.location.x = static_cast<int>(std::lround(s.location.x / templ.scale));
        s.location.y = static_cast<int>(std::lround(s.location.y / templ.scale));
        return s;
    }

    bool in_bottom_left_quadrant(cv::Point top_left, cv::Size templ_size, cv::Size frame_size) {
        const double bottom_left_x = top_left.x;
        const double bottom_left_y = top_left.y + templ_size.height;
        return bottom_left_x < 0.5 * frame_size.width &&
               bottom_left_y > 0.5 * frame_size.height;
    }
}
