#pragma once

#include <string>

#include <chapters/chapter.hpp>
#include <matching/match_deduplicator.hpp>

namespace cs {
    // "Chapter {frame_number}"
    std::string fallback_title(int64_t frame_number);

    // An empty title falls back to fallback_title(match.frame_index).
    // Throws std::invalid_argument for a negative timestamp.
    Chapter build_chapter(const DeduplicatedMatch& match, const std::string& title);
}
