#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cs {
    struct Chapter {
        std::string timestamp; // "M:SS" or "H:MM:SS"
        std::string title;
        int64_t frame_number = 0;
        double milliseconds = 0.0;
        double confidence = 0.0; // visual match score of the originating frame
    };

    // Strictly ascending milliseconds, first entry at 0, never empty.
    using ChapterList = std::vector<Chapter>;

    inline constexpr const char* kIntroductionTitle = "Introduction";
    inline constexpr const char* kNoChaptersTitle = "No chapters detected";
}
