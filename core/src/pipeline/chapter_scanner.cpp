#include <pipeline/chapter_scanner.hpp>

#include <chapters/chapter_builder.hpp>
#include <chapters/chapter_sequencer.hpp>
#include <common/log.hpp>
#include <common/timecode.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cs {
    namespace {
        // Releases the decoder on every exit path, including exceptions.
        struct SourceGuard {
            IFrameSource& src;
            ~SourceGuard() { src.close(); }
        };
    } // namespace

    cv::Rect resolve_ocr_region(const RegionConfig& region,
                                cv::Point match_loc,
                                cv::Size templ_size,
                                cv::Size frame_size) {
        cv::Rect r;
        if (region.anchor == "frame") {
            r.x = region.x;
            r.y = region.y;
            r.width = region.width > 0 ? region.width : frame_size.width - region.x;
            r.height = region.height > 0 ? region.height : frame_size.height - region.y;
        } else {
            r.x = match_loc.x + region.x;
            r.y = match_loc.y + region.y;
            r.width = region.width > 0 ? region.width : templ_size.width;
            r.height = region.height > 0 ? region.height : templ_size.height;
        }

        const cv::Rect clipped = r & cv::Rect(0, 0, frame_size.width, frame_size.height);
        if (clipped.empty()) return r;
        return clipped;
    }

    ChapterScanner::ChapterScanner(IFrameSource& source,
                                   const Template& templ,
                                   std::shared_ptr<const TextExtractor> extractor,
                                   Options opt)
        : source_(source),
          templ_(templ),
          extractor_(std::move(extractor)),
          opt_(std::move(opt)) {
        if (!(opt_.min_gap_ms >= kMinGapFloorMs)) {
            throw std::invalid_argument("[Scanner] min_gap_ms must be >= " +
                                        std::to_string(static_cast<int>(kMinGapFloorMs)));
        }
        const double s = templ_.scale > 0.0 ? templ_.scale : 1.0;
        templ_full_size_ = cv::Size(static_cast<int>(std::lround(templ_.size().width / s)),
                                    static_cast<int>(std::lround(templ_.size().height / s)));
    }

    bool ChapterScanner::should_stop_() const {
        return opt_.running && !opt_.running->load(std::memory_order_relaxed);
    }

    std::string ChapterScanner::read_title_(const Frame& frame,
                                            const DeduplicatedMatch& m,
                                            ScanReport& report) const {
        if (!extractor_) return {};

        const cv::Rect region = resolve_ocr_region(opt_.region, m.location, templ_full_size_, frame.bgr.size());
        ExtractionResult res = extractor_->extract(frame.bgr, region);
        if (!res.ok()) {
            ++report.extraction_failures;
            CS_LOG(LogLevel::Warn, "[Scanner](read_title) frame " << m.frame_index << ": "
                   << to_string(res.status) << ": " << res.error);
            return {};
        }
        if (res.text.empty()) {
            CS_LOG(LogLevel::Debug, "[Scanner](read_title) frame " << m.frame_index << ": no text above threshold");
        }
        return res.text;
    }

    ScanReport ChapterScanner::scan() {
        ScanReport report;

        source_.open();
        SourceGuard guard{source_};

        const SourceInfo& info = source_.info();
        const int interval = sampling_interval(info.fps, opt_.sample_fps);

        CS_LOG(LogLevel::Info, "[Scanner](scan) " << source_.id()
               << " fps=" << info.fps
               << " frames=" << info.frame_count
               << " size=" << info.width << "x" << info.height
               << " interval=" << interval
               << " threshold=" << opt_.threshold);

        MatchDeduplicator dedup(opt_.min_gap_ms);
        std::vector<Chapter> chapters;

        Frame frame;
        while (true) {
            if (should_stop_()) {
                report.cancelled = true;
                CS_LOG(LogLevel::Warn, "[Scanner](scan) cancelled after " << report.frames_read << " frames");
                break;
            }

            const bool sampled = (report.frames_read % interval) == 0;
            if (!source_.read(frame, sampled)) break;
            ++report.frames_read;
            if (!sampled) continue;

            ++report.frames_sampled;
            if (opt_.on_progress) opt_.on_progress(report.frames_read, info.frame_count);

            if (frame.bgr.empty()) {
                CS_LOG(LogLevel::Warn, "[Scanner](scan) frame " << frame.index << " decoded empty, skipping");
                continue;
            }

            const MatchScore score = match(frame.bgr, templ_);
            CS_LOG(LogLevel::Debug, "[Scanner](scan) frame " << frame.index
                   << " t=" << frame.timestamp_ms << "ms score=" << score.confidence
                   << " at (" << score.location.x << "," << score.location.y << ")");

            if (!accepts(score.confidence, opt_.threshold)) continue;
            if (opt_.require_bottom_left &&
                !in_bottom_left_quadrant(score.location, templ_full_size_, frame.bgr.size())) {
                CS_LOG(LogLevel::Debug, "[Scanner](scan) frame " << frame.index << " outside bottom-left quadrant");
                continue;
            }

            MatchCandidate cand;
            cand.frame_index = frame.index;
            cand.timestamp_ms = frame.timestamp_ms;
            cand.location = score.location;
            cand.confidence = score.confidence;

            const auto accepted = dedup.offer(cand);
            if (!accepted) continue;

            Chapter c = build_chapter(*accepted, read_title_(frame, *accepted, report));
            CS_LOG(LogLevel::Info, "[Scanner](scan) chapter " << c.timestamp << " \"" << c.title
                   << "\" frame=" << c.frame_number << " score=" << c.confidence);

            if (opt_.on_chapter) opt_.on_chapter(c);
            report.matches.push_back(*accepted);
            chapters.push_back(std::move(c));
        }

        report.chapters = sequence_chapters(std::move(chapters));

        CS_LOG(LogLevel::Info, "[Scanner](scan) " << source_.id()
               << " done: read=" << report.frames_read
               << " sampled=" << report.frames_sampled
               << " matches=" << report.matches.size()
               << " ocr_failures=" << report.extraction_failures
               << (report.cancelled ? " (cancelled)" : ""));
        return report;
    }
}
