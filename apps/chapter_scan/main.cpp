#include <chapters/chapter_writer.hpp>
#include <common/config.hpp>
#include <common/errors.hpp>
#include <common/log.hpp>
#include <ingest/frame_source_factory.hpp>
#include <matching/template.hpp>
#include <ocr/paddle_ocr_recognizer.hpp>
#include <ocr/text_extractor.hpp>
#include <pipeline/chapter_scanner.hpp>
#include <pipeline/thumbnail_matcher.hpp>

#include <yaml-cpp/exceptions.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

// Prints "<Kind> error: <message>" for a fatal error.
static void report_fatal(const std::exception_ptr& err) {
    try {
        std::rethrow_exception(err);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    } catch (const cs::SourceError& e) {
        std::cerr << "Source error: " << e.what() << "\n";
    } catch (const cs::TemplateError& e) {
        std::cerr << "Template error: " << e.what() << "\n";
    } catch (const cs::InvariantViolation& e) {
        std::cerr << "Invariant error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
}

// Logs at most every 10% of the expected frame count.
static auto progress_logger(const std::string& tag) {
    return [tag, last = -1](int64_t done, int64_t total) mutable {
        if (total <= 0) return;
        const int pct = static_cast<int>(std::min<int64_t>(100, done * 100 / total));
        if (pct / 10 == last / 10) return;
        last = pct;
        CS_LOG(cs::LogLevel::Info, "[" << tag << "](progress) " << pct << "% (" << done << "/" << total << ")");
    };
}

static std::shared_ptr<const cs::TextExtractor> make_extractor(const cs::OcrConfig& oc) {
    if (!oc.enabled) return nullptr;

    cs::PaddleOcrConfig pc;
    pc.det_param_path = oc.det_param;
    pc.det_bin_path = oc.det_bin;
    pc.rec_param_path = oc.rec_param;
    pc.rec_bin_path = oc.rec_bin;
    pc.dict_path = oc.dict;
    pc.ncnn_threads = oc.threads;

    auto recognizer = std::make_shared<cs::PaddleOcrRecognizer>(std::move(pc));
    return std::make_shared<const cs::TextExtractor>(std::move(recognizer), oc.min_confidence);
}

static void run_thumbnail(const cs::AppConfig& cfg, const cs::Template& templ) {
    auto src = cs::make_frame_source(cfg.video.path);

    cs::ThumbnailOptions opt;
    opt.threshold = cfg.thumbnail.threshold;
    opt.scan_duration_s = cfg.thumbnail.scan_duration_s;
    opt.sample_fps = cfg.thumbnail.sample_fps;
    opt.running = &g_running;

    const auto found = cs::find_thumbnail(*src, templ, opt);
    if (!found) {
        CS_LOG(cs::LogLevel::Warn, "[Thumbnail](run) no matching frame in the first "
               << cfg.thumbnail.scan_duration_s << "s");
        return;
    }

    const std::string out = cfg.thumbnail.output.empty()
        ? cs::default_thumbnail_path(cfg.video.path)
        : cfg.thumbnail.output;
    cs::write_thumbnail(*found, out, cfg.thumbnail.jpeg_quality);
    CS_LOG(cs::LogLevel::Info, "[Thumbnail](run) saved " << out);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/example.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    cs::AppConfig cfg;
    try {
        cfg = cs::load_config_yaml(cfg_path);
        if (argc >= 3) cfg.video.path = argv[2];
        cs::validate_config(cfg);
        cs::set_log_level(cs::log_level_from_str(cfg.log.level));
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    cs::Template templ;
    std::optional<cs::Template> thumb_templ;
    std::shared_ptr<const cs::TextExtractor> extractor;
    try {
        templ = cs::load_template(cfg.templ.path, cfg.templ.max_width);
        if (cfg.thumbnail.enabled) thumb_templ = cs::load_template(cfg.thumbnail.template_path);
    } catch (const cs::TemplateError& e) {
        std::cerr << "Template error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        extractor = make_extractor(cfg.ocr);
    } catch (const std::exception& e) {
        std::cerr << "OCR error: " << e.what() << "\n";
        return 1;
    }

    std::exception_ptr thumb_err;
    std::thread thumb_thr;
    if (thumb_templ) {
        thumb_thr = std::thread([&] {
            try {
                run_thumbnail(cfg, *thumb_templ);
            } catch (...) {
                thumb_err = std::current_exception();
            }
        });
    }

    std::exception_ptr scan_err;
    cs::ScanReport report;
    try {
        auto src = cs::make_frame_source(cfg.video.path);

        cs::ChapterScanner::Options opt;
        opt.threshold = cfg.match.threshold;
        opt.sample_fps = cfg.match.sample_fps;
        opt.min_gap_ms = cfg.match.min_gap_ms;
        opt.require_bottom_left = cfg.match.require_bottom_left;
        opt.region = cfg.ocr.region;
        opt.running = &g_running;
        opt.on_progress = progress_logger("Scanner");

        cs::ChapterScanner scanner(*src, templ, extractor, std::move(opt));
        report = scanner.scan();

        if (cfg.output.path.empty()) {
            cs::write_chapters(std::cout, report.chapters);
            std::cout.flush();
        } else {
            cs::write_chapters_file(cfg.output.path, report.chapters);
            CS_LOG(cs::LogLevel::Info, "[App](main) wrote " << report.chapters.size()
                   << " chapters to " << cfg.output.path);
        }
    } catch (...) {
        scan_err = std::current_exception();
        g_running = false;
    }

    if (thumb_thr.joinable()) thumb_thr.join();

    int rc = 0;
    if (scan_err) {
        report_fatal(scan_err);
        rc = 1;
    }
    if (thumb_err) {
        report_fatal(thumb_err);
        rc = 1;
    }
    if (rc == 0 && report.cancelled) {
        std::cerr << "Interrupted; chapter list covers the frames read so far.\n";
    }
    return rc;
}
