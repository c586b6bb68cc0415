#include <chapters/chapter_sequencer.hpp>

#include <common/errors.hpp>
#include <common/timecode.hpp>

#include <algorithm>
#include <sstream>

namespace cs {
    namespace {
        Chapter synthetic_chapter(const char* title) {
            Chapter c;
            c.timestamp = format_timestamp(0.0);
            c.title = title;
            c.frame_number = 0;
            c.milliseconds = 0.0;
            c.confidence = 0.0;
            return c;
        }

        std::string describe(const Chapter& c) {
            std::ostringstream ss;
            ss << "'" << c.timestamp << " " << c.title << "' (frame " << c.frame_number
               << ", " << c.milliseconds << " ms)";
            return ss.str();
        }
    } // namespace

    ChapterList sequence_chapters(std::vector<Chapter> chapters) {
        if (chapters.empty()) {
            return ChapterList{synthetic_chapter(kNoChaptersTitle)};
        }

        std::stable_sort(chapters.begin(),
                         chapters.end(),
                         [](const Chapter& a, const Chapter& b) { return a.milliseconds < b.milliseconds; });

        for (size_t i = 1; i < chapters.size(); ++i) {
            const Chapter& prev = chapters[i - 1];
            const Chapter& cur = chapters[i];
            if (prev.milliseconds == cur.milliseconds || prev.timestamp == cur.timestamp) {
                throw InvariantViolation("duplicate chapter timestamp: " + describe(prev) +
                                         " and " + describe(cur));
            }
        }

        ChapterList out;
        out.reserve(chapters.size() + 1);

        const Chapter& first = chapters.front();
        if (first.milliseconds > 0.0) {
            if (first.timestamp == format_timestamp(0.0)) {
                // Within the first second: an Introduction would print a second "0:00" line,
                // so the chapter itself becomes the leading entry.
                Chapter lead = first;
                lead.milliseconds = 0.0;
                out.push_back(std::move(lead));
                out.insert(out.end(), chapters.begin() + 1, chapters.end());
                return out;
            }
            out.push_back(synthetic_chapter(kIntroductionTitle));
        }
        out.insert(out.end(), chapters.begin(), chapters.end());
        return out;
    }

    void verify_chapter_list(const ChapterList& list) {
        if (list.empty()) {
            throw InvariantViolation("chapter list is empty");
        }
        if (list.front().milliseconds != 0.0) {
            throw InvariantViolation("first chapter does not start at 0: " + describe(list.front()));
        }
        for (size_t i = 0; i < list.size(); ++i) {
            const Chapter& cur = list[i];
            if (cur.timestamp != format_timestamp(cur.milliseconds)) {
                throw InvariantViolation("timestamp does not match milliseconds: " + describe(cur));
            }
            if (i == 0) continue;

            const Chapter& prev = list[i - 1];
            if (!(prev.milliseconds < cur.milliseconds)) {
                throw InvariantViolation("chapters out of order: " + describe(prev) + " then " + describe(cur));
            }
            if (prev.timestamp == cur.timestamp) {
                throw InvariantViolation("duplicate chapter timestamp: " + describe(prev) +
                                         " and " + describe(cur));
            }
        }
    }
}
