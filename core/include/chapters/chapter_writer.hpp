#pragma once

#include <ostream>
#include <string>

#include <chapters/chapter.hpp>

namespace cs {
    // Single line, single spaces, no surrounding whitespace.
    std::string sanitize_title(const std::string& title);

    // "<timestamp> <title>" per chapter joined by '\n', no trailing newline.
    // Verifies the list first (InvariantViolation).
    std::string format_chapters(const ChapterList& chapters);

    void write_chapters(std::ostream& os, const ChapterList& chapters);

    // Writes format_chapters() plus a final newline. Throws std::runtime_error on I/O failure.
    void write_chapters_file(const std::string& path, const ChapterList& chapters);
}
