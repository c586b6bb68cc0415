#include <chapters/chapter_writer.hpp>

#include <chapters/chapter_sequencer.hpp>

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace cs {
    std::string sanitize_title(const std::string& title) {
        std::string out;
        out.reserve(title.size());
        bool pending_space = false;
        for (char ch : title) {
            if (std::isspace(static_cast<unsigned char>(ch))) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) out += ' ';
            pending_space = false;
            out += ch;
        }
        return out;
    }

    std::string format_chapters(const ChapterList& chapters) {
        verify_chapter_list(chapters);

        std::string out;
        for (const auto& c : chapters) {
            if (!out.empty()) out += '\n';
            out += c.timestamp;
            out += ' ';
            out += sanitize_title(c.title);
        }
        return out;
    }

    void write_chapters(std::ostream& os, const ChapterList& chapters) {
        os << format_chapters(chapters) << "\n";
    }

    void write_chapters_file(const std::string& path, const ChapterList& chapters) {
        const std::string body = format_chapters(chapters);

        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open output file: " + path);
        }
        out << body << "\n";
        out.close();
        if (!out) {
            throw std::runtime_error("failed to write output file: " + path);
        }
    }
}
