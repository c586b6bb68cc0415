#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <ocr/text_recognizer.hpp>

namespace cs {
    constexpr double kDefaultMinTextConfidence = 0.6;

    struct TextFragment {
        int x = 0; // leftmost x of the detected region
        std::string text;
        double confidence = 0.0;
    };

    enum class ExtractionStatus {
        Ok,
        InvalidRegion,
        RecognizerFailed
    };

    struct ExtractionResult {
        ExtractionStatus status = ExtractionStatus::Ok;
        std::string text;  // fused text, may be empty when nothing was read
        std::string error; // set when status != Ok

        bool ok() const { return status == ExtractionStatus::Ok; }
    };

    const char* to_string(ExtractionStatus s);

    TextFragment to_fragment(const RecognizedText& r);

    // Drops fragments below min_confidence (equal is kept) and blank ones, orders the
    // rest by x (stable, so ties keep detection order) and joins them with one space.
    std::string fuse_fragments(const std::vector<TextFragment>& fragments, double min_confidence);

    class TextExtractor {
    public:
        explicit TextExtractor(std::shared_ptr<ITextRecognizer> recognizer,
                               double min_confidence = kDefaultMinTextConfidence);

        // Never throws for per-frame problems; they come back as a non-ok status.
        ExtractionResult extract(const cv::Mat& frame, const cv::Rect& region) const;

        double min_confidence() const { return min_confidence_; }

    private:
        std::shared_ptr<ITextRecognizer> recognizer_;
        double min_confidence_;
    };
}
