#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include <chapters/chapter.hpp>
#include <common/config.hpp>
#include <ingest/frame_source.hpp>
#include <matching/match_deduplicator.hpp>
#include <matching/template.hpp>
#include <matching/visual_matcher.hpp>
#include <ocr/text_extractor.hpp>

namespace cs {
    struct ScanReport {
        ChapterList chapters;
        // accepted matches with their own frame timestamps, before sequencing
        std::vector<DeduplicatedMatch> matches;
        int64_t frames_read = 0;
        int64_t frames_sampled = 0;
        int extraction_failures = 0;
        bool cancelled = false;
    };

    // Region handed to the text extractor for a match at `match_loc`.
    // templ_size is the template size at frame resolution. The result is clipped to the
    // frame; if nothing is left the unclipped rect is returned so the extractor rejects it.
    cv::Rect resolve_ocr_region(const RegionConfig& region,
                                cv::Point match_loc,
                                cv::Size templ_size,
                                cv::Size frame_size);

    class ChapterScanner {
    public:
        struct Options {
            double threshold = kDefaultMatchThreshold;
            double sample_fps = 3.0;
            double min_gap_ms = kDefaultMinGapMs;
            bool require_bottom_left = false;
            RegionConfig region;

            // cleared from outside to stop the scan after the current frame
            const std::atomic<bool>* running = nullptr;

            std::function<void(int64_t frames_read, int64_t total_frames)> on_progress;
            std::function<void(const Chapter&)> on_chapter;
        };

        // extractor may be null: every chapter then gets the fallback title.
        // Throws std::invalid_argument if opt.min_gap_ms is below kMinGapFloorMs.
        ChapterScanner(IFrameSource& source,
                       const Template& templ,
                       std::shared_ptr<const TextExtractor> extractor,
                       Options opt);

        // Single pass over the source. Throws SourceError if the video cannot be
        // opened or decoded, InvariantViolation if the chapter list would be malformed.
        ScanReport scan();

    private:
        bool should_stop_() const;
        std::string read_title_(const Frame& frame, const DeduplicatedMatch& m, ScanReport& report) const;

        IFrameSource& source_;
        const Template& templ_;
        std::shared_ptr<const TextExtractor> extractor_;
        Options opt_;
        cv::Size templ_full_size_;
    };
}
