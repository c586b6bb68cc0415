#include <pipeline/thumbnail_matcher.hpp>

#include <common/errors.hpp>
#include <common/log.hpp>
#include <common/resize.hpp>
#include <common/timecode.hpp>
#include <matching/ssim.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace cs {
    namespace {
        struct SourceGuard {
            IFrameSource& src;
            ~SourceGuard() { src.close(); }
        };
    } // namespace

    std::optional<ThumbnailResult> find_thumbnail(IFrameSource& source,
                                                  const Template& templ,
                                                  const ThumbnailOptions& opt) {
        const SsimParams params;
        const cv::Size tsize = templ.size();
        if (tsize.width < params.win_size || tsize.height < params.win_size) {
            throw TemplateError("thumbnail template " + templ.name + " is smaller than " +
                                std::to_string(params.win_size) + "x" + std::to_string(params.win_size));
        }

        source.open();
        SourceGuard guard{source};

        const SourceInfo& info = source.info();
        const int interval = sampling_interval(info.fps, opt.sample_fps);
        const double window_ms = static_cast<double>(opt.scan_duration_s) * 1000.0;

        int64_t budget = static_cast<int64_t>(std::ceil(opt.scan_duration_s * info.fps));
        if (info.frame_count > 0) budget = std::min(budget, info.frame_count);

        CS_LOG(LogLevel::Info, "[Thumbnail](find) " << source.id()
               << " window=" << opt.scan_duration_s << "s interval=" << interval
               << " threshold=" << opt.threshold);

        Frame frame;
        int64_t frames_read = 0;
        double best = -1.0;
        while (true) {
            if (opt.running && !opt.running->load(std::memory_order_relaxed)) {
                CS_LOG(LogLevel::Warn, "[Thumbnail](find) cancelled after " << frames_read << " frames");
                return std::nullopt;
            }

            // window end: stop before decoding anything past it
            if (frame_timestamp_ms(frames_read, info.fps) >= window_ms) break;

            const bool sampled = (frames_read % interval) == 0;
            if (!source.read(frame, sampled)) break;
            ++frames_read;
            if (!sampled || frame.bgr.empty()) continue;

            if (opt.on_progress) opt.on_progress(frames_read, budget);

            const cv::Mat gray = to_gray(resize_frame(frame.bgr, tsize));
            const double score = ssim(gray, templ.gray, params);
            best = std::max(best, score);
            CS_LOG(LogLevel::Debug, "[Thumbnail](find) frame " << frame.index << " ssim=" << score);

            if (score >= opt.threshold) {
                ThumbnailResult r;
                r.frame_index = frame.index;
                r.timestamp_ms = frame.timestamp_ms;
                r.score = score;
                r.frame = frame.bgr.clone();
                CS_LOG(LogLevel::Info, "[Thumbnail](find) match at " << format_timestamp(r.timestamp_ms)
                       << " frame=" << r.frame_index << " ssim=" << score);
                return r;
            }
        }

        CS_LOG(LogLevel::Info, "[Thumbnail](find) no frame reached " << opt.threshold
               << " (best " << best << ")");
        return std::nullopt;
    }

    std::string default_thumbnail_path(const std::string& video_path) {
        const std::filesystem::path p(video_path);
        return (std::filesystem::current_path() / (p.stem().string() + "-thumbnail.jpg")).string();
    }

    void write_thumbnail(const ThumbnailResult& result, const std::string& path, int jpeg_quality) {
        if (result.frame.empty()) {
            throw std::runtime_error("thumbnail frame is empty");
        }
        const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(jpeg_quality, 1, 100)};
        if (!cv::imwrite(path, result.frame, params)) {
            throw std::runtime_error("failed to write thumbnail: " + path);
        }
    }
}
