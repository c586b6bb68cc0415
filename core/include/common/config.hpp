#pragma once

#include <string>

namespace cs {
    struct VideoConfig {
        std::string path;
    };

    struct TemplateConfig {
        std::string path = "data/template.png";
        int max_width = 0; // 0 = keep native size
    };

    struct MatchConfig {
        double threshold = 0.8;
        double sample_fps = 3.0;
        double min_gap_ms = 5000.0;
        bool require_bottom_left = false;
    };

    struct RegionConfig {
        std::string anchor = "match"; // match|frame
        int x = 0;
        int y = 0;
        int width = 0;  // 0 = template width (match) / to frame edge (frame)
        int height = 0;
    };

    struct OcrConfig {
        bool enabled = true;
        double min_confidence = 0.6;
        RegionConfig region;

        std::string det_param = "models/ocr/det.param";
        std::string det_bin = "models/ocr/det.bin";
        std::string rec_param = "models/ocr/rec.param";
        std::string rec_bin = "models/ocr/rec.bin";
        std::string dict = "models/ocr/keys.txt";
        int threads = 1;
    };

    struct OutputConfig {
        std::string path; // empty = stdout
    };

    struct ThumbnailConfig {
        bool enabled = false;
        std::string template_path = "data/thumbnail_template.png";
        double threshold = 0.35;
        int scan_duration_s = 120;
        double sample_fps = 3.0;
        std::string output; // empty = ./<video stem>-thumbnail.jpg
        int jpeg_quality = 95;
    };

    struct LogConfig {
        std::string level = "info";
    };

    struct AppConfig {
        VideoConfig video;
        TemplateConfig templ;
        MatchConfig match;
        OcrConfig ocr;
        OutputConfig output;
        ThumbnailConfig thumbnail;
        LogConfig log;
    };

    AppConfig load_config_yaml(const std::string& path);

    // Throws std::runtime_error("[Config] ...") on the first invalid field.
    void validate_config(const AppConfig& cfg);
}
