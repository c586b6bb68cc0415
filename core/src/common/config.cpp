#include <common/config.hpp>
#include <common/log.hpp>
#include <matching/match_deduplicator.hpp>

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace cs {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static TemplateConfig parse_template_config(const YAML::Node& tc) {
        TemplateConfig c;
        if (!tc) return c;
        c.path = get_str(tc, "path", c.path);
        c.max_width = get_int(tc, "max_width", c.max_width);
        return c;
    }

    static MatchConfig parse_match_config(const YAML::Node& mc) {
        MatchConfig c;
        if (!mc) return c;
        c.threshold = get_double(mc, "threshold", c.threshold);
        c.sample_fps = get_double(mc, "sample_fps", c.sample_fps);
        c.min_gap_ms = get_double(mc, "min_gap_ms", c.min_gap_ms);
        c.require_bottom_left = get_bool(mc, "require_bottom_left", c.require_bottom_left);
        return c;
    }

    static RegionConfig parse_region_config(const YAML::Node& rc) {
        RegionConfig c;
        if (!rc) return c;
        c.anchor = get_str(rc, "anchor", c.anchor);
        c.x = get_int(rc, "x", c.x);
        c.y = get_int(rc, "y", c.y);
        c.width = get_int(rc, "width", c.width);
        c.height = get_int(rc, "height", c.height);
        return c;
    }

    static OcrConfig parse_ocr_config(const YAML::Node& oc) {
        OcrConfig c;
        if (!oc) return c;
        c.enabled = get_bool(oc, "enabled", c.enabled);
        c.min_confidence = get_double(oc, "min_confidence", c.min_confidence);
        c.region = parse_region_config(oc["region"]);
        c.det_param = get_str(oc, "det_param", c.det_param);
        c.det_bin = get_str(oc, "det_bin", c.det_bin);
        c.rec_param = get_str(oc, "rec_param", c.rec_param);
        c.rec_bin = get_str(oc, "rec_bin", c.rec_bin);
        c.dict = get_str(oc, "dict", c.dict);
        c.threads = get_int(oc, "threads", c.threads);
        return c;
    }

    static ThumbnailConfig parse_thumbnail_config(const YAML::Node& tc) {
        ThumbnailConfig c;
        if (!tc) return c;
        c.enabled = get_bool(tc, "enabled", c.enabled);
        c.template_path = get_str(tc, "template", c.template_path);
        c.threshold = get_double(tc, "threshold", c.threshold);
        c.scan_duration_s = get_int(tc, "scan_duration_s", c.scan_duration_s);
        c.sample_fps = get_double(tc, "sample_fps", c.sample_fps);
        c.output = get_str(tc, "output", c.output);
        c.jpeg_quality = get_int(tc, "jpeg_quality", c.jpeg_quality);
        return c;
    }

    static void require(bool ok, const std::string& message) {
        if (!ok) throw std::runtime_error("[Config] " + message);
    }

    void validate_config(const AppConfig& cfg) {
        require(!cfg.video.path.empty(), "video.path is empty!");
        require(!cfg.templ.path.empty(), "template.path is empty!");
        require(cfg.templ.max_width >= 0, "template.max_width must be >= 0");

        require(cfg.match.threshold >= 0.0 && cfg.match.threshold <= 1.0,
                "match.threshold must be within [0, 1]");
        require(cfg.match.sample_fps > 0.0, "match.sample_fps must be > 0");
        require(cfg.match.min_gap_ms >= kMinGapFloorMs, "match.min_gap_ms must be >= 1000");

        require(cfg.ocr.min_confidence >= 0.0 && cfg.ocr.min_confidence <= 1.0,
                "ocr.min_confidence must be within [0, 1]");
        require(cfg.ocr.region.anchor == "match" || cfg.ocr.region.anchor == "frame",
                "ocr.region.anchor must be match or frame, got " + cfg.ocr.region.anchor);
        require(cfg.ocr.region.width >= 0 && cfg.ocr.region.height >= 0,
                "ocr.region width/height must be >= 0");
        require(cfg.ocr.threads >= 1, "ocr.threads must be >= 1");

        if (cfg.thumbnail.enabled) {
            require(!cfg.thumbnail.template_path.empty(), "thumbnail.template is empty!");
            require(cfg.thumbnail.threshold >= 0.0 && cfg.thumbnail.threshold <= 1.0,
                    "thumbnail.threshold must be within [0, 1]");
            require(cfg.thumbnail.scan_duration_s > 0, "thumbnail.scan_duration_s must be > 0");
            require(cfg.thumbnail.sample_fps > 0.0, "thumbnail.sample_fps must be > 0");
            require(cfg.thumbnail.jpeg_quality >= 1 && cfg.thumbnail.jpeg_quality <= 100,
                    "thumbnail.jpeg_quality must be within [1, 100]");
        }

        (void)log_level_from_str(cfg.log.level);
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);
        if (!root || !root.IsMap()) {
            throw std::runtime_error("[Config] " + path + " is not a YAML map!");
        }

        cfg.video.path = get_str(root["video"], "path", "");
        cfg.templ = parse_template_config(root["template"]);
        cfg.match = parse_match_config(root["match"]);
        cfg.ocr = parse_ocr_config(root["ocr"]);
        cfg.output.path = get_str(root["output"], "path", "");
        cfg.thumbnail = parse_thumbnail_config(root["thumbnail"]);
        cfg.log.level = get_str(root["log"], "level", cfg.log.level);

        return cfg;
    }
}
