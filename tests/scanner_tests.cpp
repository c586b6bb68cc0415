#include <chapters/chapter_sequencer.hpp>
#include <chapters/chapter_writer.hpp>
#include <common/errors.hpp>
#include <matching/template.hpp>
#include <ocr/text_extractor.hpp>
#include <pipeline/chapter_scanner.hpp>

#include "fakes.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    const cv::Size kFrameSize(160, 120);
    const cv::Size kLogoSize(24, 16);
    const double kFps = 30.0;
    const int64_t kFrames = 450; // 15 s

    struct Appearance {
        int64_t from;
        int64_t to; // exclusive
    };

    // Graphic visible at 2-3 s, 10-11 s and again at 13-14 s (inside the 5 s gap).
    const std::vector<Appearance> kAppearances = {{60, 90}, {300, 330}, {390, 420}};

    cv::Mat logo() {
        return cs_test::noise_image(kLogoSize, 12345);
    }

    cs_test::FakeFrameSource broadcast(cv::Point logo_at, std::vector<Appearance> shows = kAppearances) {
        const cv::Mat graphic = logo();
        return cs_test::FakeFrameSource(kFrames, kFps, kFrameSize, [graphic, logo_at, shows](int64_t i) {
            cv::Mat frame = cs_test::noise_image(kFrameSize, 500 + static_cast<uint64_t>(i));
            for (const auto& a : shows) {
                if (i >= a.from && i < a.to) cs_test::paste(frame, graphic, logo_at);
            }
            return frame;
        });
    }

    cs::ChapterScanner::Options default_options() {
        cs::ChapterScanner::Options opt;
        opt.threshold = 0.8;
        opt.sample_fps = 3.0;
        opt.min_gap_ms = 5000.0;
        return opt;
    }

    void test_chapters_without_ocr() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        std::vector<std::string> announced;
        auto opt = default_options();
        opt.on_chapter = [&](const cs::Chapter& c) { announced.push_back(c.timestamp); };

        cs::ChapterScanner scanner(src, t, nullptr, std::move(opt));
        const cs::ScanReport r = scanner.scan();

        check(r.frames_read == kFrames, "every frame should be read");
        check(r.frames_sampled == 45, "every 10th frame should be sampled");
        check(src.decoded == 45, "only sampled frames should be decoded");
        check(!r.cancelled, "a complete scan is not cancelled");
        check(r.matches.size() == 2, "the third appearance falls inside the gap");

        const std::string text = cs::format_chapters(r.chapters);
        check(text == "0:00 Introduction\n0:02 Chapter 60\n0:10 Chapter 300",
              "unexpected chapter list:\n" + text);
        check(announced.size() == 2 && announced[0] == "0:02", "on_chapter fires per accepted match");
        if (r.chapters.size() == 3) {
            check(r.chapters[1].confidence > 0.99, "the chapter keeps the match confidence");
            check(r.chapters[1].frame_number == 60, "the chapter keeps the frame number");
        }
        check(src.close_calls == 1, "the source is released after the scan");
    }

    void test_titles_from_ocr() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        auto rec = std::make_shared<cs_test::FakeRecognizer>(std::vector<cs::RecognizedText>{
            cs_test::recognized(100, "#12", 0.88),
            cs_test::recognized(0, "Jane Doe", 0.95),
        });
        auto extractor = std::make_shared<const cs::TextExtractor>(rec, 0.6);

        cs::ChapterScanner scanner(src, t, extractor, default_options());
        const cs::ScanReport r = scanner.scan();

        check(r.chapters.size() == 3, "two chapters plus Introduction");
        check(r.chapters.size() == 3 && r.chapters[1].title == "Jane Doe #12", "titles come from OCR");
        check(rec->calls == 2, "OCR runs once per accepted match");
        check(rec->last_size == kLogoSize, "the default region is the matched template area");
        check(r.extraction_failures == 0, "no extraction failures expected");
    }

    void test_ocr_failure_falls_back() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        auto rec = std::make_shared<cs_test::FakeRecognizer>();
        rec->fail_message = "model crashed";
        auto extractor = std::make_shared<const cs::TextExtractor>(rec);

        cs::ChapterScanner scanner(src, t, extractor, default_options());
        const cs::ScanReport r = scanner.scan();

        check(r.extraction_failures == 2, "each failed extraction is counted");
        check(cs::format_chapters(r.chapters) == "0:00 Introduction\n0:02 Chapter 60\n0:10 Chapter 300",
              "failed extractions fall back to frame titles");
    }

    void test_empty_ocr_text_falls_back() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        auto rec = std::make_shared<cs_test::FakeRecognizer>(std::vector<cs::RecognizedText>{
            cs_test::recognized(0, "blurry", 0.3),
        });
        auto extractor = std::make_shared<const cs::TextExtractor>(rec, 0.6);

        cs::ChapterScanner scanner(src, t, extractor, default_options());
        const cs::ScanReport r = scanner.scan();
        check(r.chapters.size() == 3 && r.chapters[1].title == "Chapter 60",
              "no confident text means the fallback title");
        check(r.extraction_failures == 0, "empty text is not a failure");
    }

    void test_deterministic() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");

        auto a = broadcast({10, 90});
        auto b = broadcast({10, 90});
        const auto ra = cs::ChapterScanner(a, t, nullptr, default_options()).scan();
        const auto rb = cs::ChapterScanner(b, t, nullptr, default_options()).scan();
        check(cs::format_chapters(ra.chapters) == cs::format_chapters(rb.chapters), "same video gives same chapters");
    }

    void test_no_matches() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90}, {});

        const auto r = cs::ChapterScanner(src, t, nullptr, default_options()).scan();
        check(cs::format_chapters(r.chapters) == "0:00 No chapters detected", "no matches gives the placeholder");
        check(r.matches.empty(), "no matches reported");
    }

    void test_bottom_left_gate() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");

        auto top_right = broadcast({120, 10});
        auto opt = default_options();
        opt.require_bottom_left = true;
        const auto gated = cs::ChapterScanner(top_right, t, nullptr, opt).scan();
        check(gated.matches.empty(), "matches outside the bottom-left quadrant are dropped");

        auto top_right_again = broadcast({120, 10});
        const auto ungated = cs::ChapterScanner(top_right_again, t, nullptr, default_options()).scan();
        check(ungated.matches.size() == 2, "without the gate the same matches are accepted");
    }

    void test_match_at_frame_zero() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90}, {{0, 30}, {300, 330}});

        const auto r = cs::ChapterScanner(src, t, nullptr, default_options()).scan();
        check(cs::format_chapters(r.chapters) == "0:00 Chapter 0\n0:10 Chapter 300",
              "a match at frame 0 replaces the Introduction");
    }

    void test_smallest_gap_one_chapter_per_second() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90}, {{60, 120}}); // 2 s to 4 s

        auto opt = default_options();
        opt.min_gap_ms = cs::kMinGapFloorMs;
        const auto r = cs::ChapterScanner(src, t, nullptr, std::move(opt)).scan();

        check(r.matches.size() == 2, "a one second gap keeps frames 60 and 90");
        check(cs::format_chapters(r.chapters) == "0:00 Introduction\n0:02 Chapter 60\n0:03 Chapter 90",
              "matches one second apart print distinct lines:\n" + cs::format_chapters(r.chapters));
    }

    void test_gap_below_one_second_rejected() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        auto opt = default_options();
        opt.min_gap_ms = 500.0;
        bool threw = false;
        try {
            cs::ChapterScanner scanner(src, t, nullptr, std::move(opt));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "a gap that allows two chapters in one second is rejected");
        check(src.open_calls == 0, "the video is not opened for a rejected gap");
    }

    void test_first_second_match_keeps_its_time_on_the_report() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90}, {{10, 30}});

        double announced_ms = -1.0;
        auto opt = default_options();
        opt.on_chapter = [&](const cs::Chapter& c) { announced_ms = c.milliseconds; };
        const auto r = cs::ChapterScanner(src, t, nullptr, std::move(opt)).scan();

        check(cs::format_chapters(r.chapters) == "0:00 Chapter 10", "the early match leads the list");
        check(r.chapters.size() == 1 && r.chapters[0].milliseconds == 0.0, "the leading chapter sits at 0 ms");
        check(r.matches.size() == 1 && r.matches[0].timestamp_ms > 300.0,
              "the report keeps the match's own timestamp");
        check(announced_ms > 300.0, "on_chapter sees the chapter before it is moved to 0 ms");
    }

    void test_cancellation() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});

        std::atomic<bool> running(true);
        auto opt = default_options();
        opt.running = &running;
        opt.on_chapter = [&](const cs::Chapter&) { running = false; };

        const auto r = cs::ChapterScanner(src, t, nullptr, std::move(opt)).scan();
        check(r.cancelled, "clearing the running flag cancels the scan");
        check(r.frames_read == 61, "the scan stops right after the frame that cleared the flag");
        check(cs::format_chapters(r.chapters) == "0:00 Introduction\n0:02 Chapter 60",
              "a cancelled scan returns what it found so far");
        check(src.close_calls == 1, "a cancelled scan still releases the source");
    }

    void test_open_failure() {
        const cs::Template t = cs::make_template(logo(), 0, "logo");
        auto src = broadcast({10, 90});
        src.fail_open = true;

        bool threw = false;
        try {
            (void)cs::ChapterScanner(src, t, nullptr, default_options()).scan();
        } catch (const cs::SourceError&) {
            threw = true;
        }
        check(threw, "an unopenable video raises SourceError");
    }

    void test_resolve_ocr_region() {
        cs::RegionConfig match_anchor;
        check(cs::resolve_ocr_region(match_anchor, {10, 90}, kLogoSize, kFrameSize) == cv::Rect(10, 90, 24, 16),
              "default region is the template area");

        cs::RegionConfig below;
        below.y = 16;
        below.width = 100;
        below.height = 20;
        check(cs::resolve_ocr_region(below, {10, 90}, kLogoSize, kFrameSize) == cv::Rect(10, 106, 100, 14),
              "offset region is clipped to the frame");

        cs::RegionConfig frame_anchor;
        frame_anchor.anchor = "frame";
        frame_anchor.x = 20;
        frame_anchor.y = 100;
        check(cs::resolve_ocr_region(frame_anchor, {0, 0}, kLogoSize, kFrameSize) == cv::Rect(20, 100, 140, 20),
              "zero size on a frame anchor extends to the frame edge");

        cs::RegionConfig off_frame;
        off_frame.anchor = "frame";
        off_frame.x = 500;
        off_frame.width = 10;
        off_frame.height = 10;
        check(cs::resolve_ocr_region(off_frame, {0, 0}, kLogoSize, kFrameSize) == cv::Rect(500, 0, 10, 10),
              "a region entirely outside the frame is returned unclipped");
    }
}

int main() {
    test_chapters_without_ocr();
    test_titles_from_ocr();
    test_ocr_failure_falls_back();
    test_empty_ocr_text_falls_back();
    test_deterministic();
    test_no_matches();
    test_bottom_left_gate();
    test_match_at_frame_zero();
    test_smallest_gap_one_chapter_per_second();
    test_gap_below_one_second_rejected();
    test_first_second_match_keeps_its_time_on_the_report();
    test_cancellation();
    test_open_failure();
    test_resolve_ocr_region();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all scanner tests passed\n";
    return 0;
}
