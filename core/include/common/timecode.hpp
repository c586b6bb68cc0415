#pragma once

#include <cstdint>
#include <string>

namespace cs {
    // YouTube chapter syntax: "H:MM:SS" from one hour on, "M:SS" below.
    // Fractional milliseconds are floored to the whole second.
    // Throws std::invalid_argument for negative or non-finite input.
    std::string format_timestamp(double milliseconds);

    // index / fps * 1000. fps <= 0 yields 0.
    double frame_timestamp_ms(int64_t frame_index, double fps);

    // Process every Nth frame to sample `sample_fps` frames per second of video.
    // Always >= 1.
    int sampling_interval(double video_fps, double sample_fps);
}
