#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include <ingest/frame_source.hpp>
#include <matching/template.hpp>

namespace cs {
    constexpr double kDefaultThumbnailThreshold = 0.35;

    struct ThumbnailOptions {
        double threshold = kDefaultThumbnailThreshold;
        int scan_duration_s = 120;
        double sample_fps = 3.0;

        const std::atomic<bool>* running = nullptr;
        std::function<void(int64_t frames_read, int64_t frames_budget)> on_progress;
    };

    struct ThumbnailResult {
        int64_t frame_index = 0;
        double timestamp_ms = 0.0;
        double score = 0.0;
        cv::Mat frame; // full-resolution BGR
    };

    // Returns the first sampled frame within the scan window whose SSIM against the
    // template reaches the threshold, or nullopt. Opens and closes the source.
    // Throws TemplateError if the template is too small for the SSIM window,
    // SourceError on decode failure.
    std::optional<ThumbnailResult> find_thumbnail(IFrameSource& source,
                                                  const Template& templ,
                                                  const ThumbnailOptions& opt = {});

    // <video stem>-thumbnail.jpg in the current working directory
    std::string default_thumbnail_path(const std::string& video_path);

    // Throws std::runtime_error if the image cannot be encoded or written.
    void write_thumbnail(const ThumbnailResult& result, const std::string& path, int jpeg_quality = 95);
}
