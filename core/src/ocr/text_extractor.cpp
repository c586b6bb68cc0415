#include <ocr/text_extractor.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace cs {
    namespace {
        std::string trim(const std::string& s) {
            size_t b = 0;
            size_t e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
            return s.substr(b, e - b);
        }

        ExtractionResult failure(ExtractionStatus status, std::string error) {
            ExtractionResult r;
            r.status = status;
            r.error = std::move(error);
            return r;
        }

        std::string describe(const cv::Rect& r) {
            return "(" + std::to_string(r.x) + ", " + std::to_string(r.y) + ", " +
                   std::to_string(r.width) + ", " + std::to_string(r.height) + ")";
        }
    } // namespace

    const char* to_string(ExtractionStatus s) {
        switch (s) {
            case ExtractionStatus::Ok: return "ok";
            case ExtractionStatus::InvalidRegion: return "invalid region";
            case ExtractionStatus::RecognizerFailed: return "recognizer failed";
        }
        return "unknown";
    }

    TextFragment to_fragment(const RecognizedText& r) {
        TextFragment f;
        f.text = r.text;
        f.confidence = r.confidence;
        if (!r.polygon.empty()) {
            f.x = std::min_element(r.polygon.begin(),
                                   r.polygon.end(),
                                   [](const cv::Point& a, const cv::Point& b) { return a.x < b.x; })->x;
        }
        return f;
    }

    std::string fuse_fragments(const std::vector<TextFragment>& fragments, double min_confidence) {
        std::vector<TextFragment> kept;
        kept.reserve(fragments.size());
        for (const auto& f : fragments) {
            if (f.confidence < min_confidence) continue;
            std::string text = trim(f.text);
            if (text.empty()) continue;
            kept.push_back({f.x, std::move(text), f.confidence});
        }

        std::stable_sort(kept.begin(),
                         kept.end(),
                         [](const TextFragment& a, const TextFragment& b) { return a.x < b.x; });

        std::string out;
        for (const auto& f : kept) {
            if (!out.empty()) out += ' ';
            out += f.text;
        }
        return out;
    }

    TextExtractor::TextExtractor(std::shared_ptr<ITextRecognizer> recognizer, double min_confidence)
        : recognizer_(std::move(recognizer)),
          min_confidence_(min_confidence) {
        if (!recognizer_) {
            throw std::invalid_argument("TextExtractor needs a recognizer");
        }
    }

    ExtractionResult TextExtractor::extract(const cv::Mat& frame, const cv::Rect& region) const {
        if (frame.empty()) {
            return failure(ExtractionStatus::InvalidRegion, "frame is empty");
        }

        const cv::Rect bounds(0, 0, frame.cols, frame.rows);
        if (region.width <= 0 || region.height <= 0 || (region & bounds) != region) {
            return failure(ExtractionStatus::InvalidRegion,
                           "region " + describe(region) + " outside frame " +
                           std::to_string(frame.cols) + "x" + std::to_string(frame.rows));
        }

        std::vector<RecognizedText> raw;
        try {
            raw = recognizer_->recognize(frame(region));
        } catch (const std::exception& e) {
            return failure(ExtractionStatus::RecognizerFailed, e.what());
        }

        std::vector<TextFragment> fragments;
        fragments.reserve(raw.size());
        for (const auto& r : raw) fragments.push_back(to_fragment(r));

        ExtractionResult out;
        out.text = fuse_fragments(fragments, min_confidence_);
        return out;
    }
}
