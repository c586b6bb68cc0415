#include <common/timecode.hpp>

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace cs {
    std::string format_timestamp(double milliseconds) {
        if (!std::isfinite(milliseconds) || milliseconds < 0.0) {
            throw std::invalid_argument("timestamp must be a non-negative number of milliseconds");
        }

        const auto total_seconds = static_cast<int64_t>(std::floor(milliseconds / 1000.0));
        const int64_t hours = total_seconds / 3600;
        const int64_t minutes = (total_seconds % 3600) / 60;
        const int64_t seconds = total_seconds % 60;

        char buf[48];
        if (hours > 0) {
            std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                          static_cast<long long>(hours),
                          static_cast<long long>(minutes),
                          static_cast<long long>(seconds));
        } else {
            std::snprintf(buf, sizeof(buf), "%lld:%02lld",
                          static_cast<long long>(minutes),
                          static_cast<long long>(seconds));
        }
        return buf;
    }

    double frame_timestamp_ms(int64_t frame_index, double fps) {
        if (fps <= 0.0) return 0.0;
        return static_cast<double>(frame_index) / fps * 1000.0;
    }

    int sampling_interval(double video_fps, double sample_fps) {
        if (video_fps <= 0.0 || sample_fps <= 0.0) return 1;
        const int n = static_cast<int>(video_fps / sample_fps);
        return n < 1 ? 1 : n;
    }
}
