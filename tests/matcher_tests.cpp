#include <common/errors.hpp>
#include <matching/template.hpp>
#include <matching/visual_matcher.hpp>

#include "fakes.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <opencv2/imgproc.hpp>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    const cv::Size kFrameSize(200, 150);
    const cv::Point kLogoAt(40, 90);

    cv::Mat frame_with_logo(const cv::Mat& logo) {
        cv::Mat frame = cs_test::noise_image(kFrameSize, 7);
        cs_test::paste(frame, logo, kLogoAt);
        return frame;
    }

    void test_finds_embedded_template() {
        const cv::Mat logo = cs_test::noise_image({30, 20}, 99);
        const cv::Mat frame = frame_with_logo(logo);

        const cs::MatchScore s = cs::match(frame, logo);
        check(s.confidence > 0.99, "an exact copy should score close to 1, got " + std::to_string(s.confidence));
        check(s.location == kLogoAt, "the best match should be at the paste location");
    }

    void test_grayscale_inputs() {
        const cv::Mat logo = cs_test::noise_image({30, 20}, 99);
        cv::Mat frame_gray, logo_gray;
        cv::cvtColor(frame_with_logo(logo), frame_gray, cv::COLOR_BGR2GRAY);
        cv::cvtColor(logo, logo_gray, cv::COLOR_BGR2GRAY);

        const cs::MatchScore s = cs::match(frame_gray, logo_gray);
        check(s.confidence > 0.99 && s.location == kLogoAt, "single-channel inputs should match the same way");
    }

    void test_absent_template_scores_low() {
        const cv::Mat logo = cs_test::noise_image({30, 20}, 99);
        const cv::Mat frame = cs_test::noise_image(kFrameSize, 7);

        const cs::MatchScore s = cs::match(frame, logo);
        check(s.confidence >= 0.0 && s.confidence <= 1.0, "confidence should stay within [0, 1]");
        check(!cs::accepts(s.confidence, cs::kDefaultMatchThreshold), "unrelated noise should not pass 0.8");
    }

    void test_template_larger_than_frame() {
        const cv::Mat small = cs_test::noise_image({20, 20}, 1);
        const cv::Mat big = cs_test::noise_image({40, 40}, 2);

        const cs::MatchScore s = cs::match(small, big);
        check(s.confidence == 0.0, "a template larger than the frame scores 0");
        check(s.location == cv::Point(0, 0), "a template larger than the frame reports (0, 0)");
    }

    void test_empty_input_throws() {
        bool threw = false;
        try {
            (void)cs::match(cv::Mat(), cs_test::noise_image({10, 10}, 1));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "an empty frame should be rejected");
    }

    void test_downscaled_template_maps_back() {
        const cv::Mat logo = cs_test::noise_image({30, 20}, 99);
        const cv::Mat frame = frame_with_logo(logo);

        const cs::Template t = cs::make_template(logo, 15, "logo");
        check(t.scale == 0.5, "max_width 15 should halve a 30 px template");
        check(t.size() == cv::Size(15, 10), "downscaled template should be 15x10");

        const cs::MatchScore s = cs::match(frame, t);
        check(s.confidence > 0.9, "downscaled matching should still find the logo");
        check(std::abs(s.location.x - kLogoAt.x) <= 2 && std::abs(s.location.y - kLogoAt.y) <= 2,
              "location should be reported in full-resolution coordinates");
    }

    void test_make_template_rejects_bad_images() {
        bool empty_threw = false;
        try {
            (void)cs::make_template(cv::Mat());
        } catch (const cs::TemplateError&) {
            empty_threw = true;
        }
        check(empty_threw, "an empty template should raise TemplateError");

        bool missing_threw = false;
        try {
            (void)cs::load_template("/nonexistent/template.png");
        } catch (const cs::TemplateError&) {
            missing_threw = true;
        }
        check(missing_threw, "a missing template file should raise TemplateError");

        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path garbage = fs::temp_directory_path() / ("cs_templ_" + std::to_string(stamp) + ".png");
        {
            std::ofstream out(garbage, std::ios::binary);
            out << "not an image";
        }
        bool unreadable_threw = false;
        try {
            (void)cs::load_template(garbage.string());
        } catch (const cs::TemplateError&) {
            unreadable_threw = true;
        }
        fs::remove(garbage);
        check(unreadable_threw, "an undecodable template file should raise TemplateError");
    }

    void test_threshold_is_inclusive() {
        check(cs::accepts(0.8, 0.8), "a score equal to the threshold is accepted");
        check(!cs::accepts(0.7999, 0.8), "a score just under the threshold is rejected");
        check(cs::accepts(1.0, 0.8), "a perfect score is accepted");
    }

    void test_bottom_left_quadrant() {
        const cv::Size frame(200, 200);
        const cv::Size templ(20, 30);
        check(cs::in_bottom_left_quadrant({10, 100}, templ, frame), "(10,100) is bottom-left");
        check(!cs::in_bottom_left_quadrant({150, 100}, templ, frame), "(150,100) is bottom-right");
        check(!cs::in_bottom_left_quadrant({10, 10}, templ, frame), "(10,10) is top-left");
    }
}

int main() {
    test_finds_embedded_template();
    test_grayscale_inputs();
    test_absent_template_scores_low();
    test_template_larger_than_frame();
    test_empty_input_throws();
    test_downscaled_template_maps_back();
    test_make_template_rejects_bad_images();
    test_threshold_is_inclusive();
    test_bottom_left_quadrant();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all matcher tests passed\n";
    return 0;
}
