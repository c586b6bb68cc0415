#include <chapters/chapter_builder.hpp>

#include <common/timecode.hpp>

namespace cs {
    std::string fallback_title(int64_t frame_number) {
        return "Chapter " + std::to_string(frame_number);
    }

    Chapter build_chapter(const DeduplicatedMatch& match, const std::string& title) {
        Chapter c;
        c.timestamp = format_timestamp(match.timestamp_ms);
        c.title = title.empty() ? fallback_title(match.frame_index) : title;
        c.frame_number = match.frame_index;
        c.milliseconds = match.timestamp_ms;
        c.confidence = match.confidence;
        return c;
    }
}
