#pragma once

#include <vector>

#include <chapters/chapter.hpp>

namespace cs {
    // Orders chapters by time and guarantees a leading 0:00 entry.
    //  - no chapters: a single "No chapters detected" placeholder at 0:00
    //  - first chapter after 0 ms: an "Introduction" chapter is prepended
    //  - first chapter inside the first second: its milliseconds are rewritten to 0
    //    (frame_number is kept) and no Introduction is added
    // Throws InvariantViolation when two chapters share a timestamp; the
    // deduplicator upstream must never let that happen.
    ChapterList sequence_chapters(std::vector<Chapter> chapters);

    // Throws InvariantViolation describing the first broken guarantee.
    void verify_chapter_list(const ChapterList& list);
}
