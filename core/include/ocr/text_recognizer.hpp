#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace cs {
    // One detected text region as reported by a recognition backend.
    struct RecognizedText {
        std::vector<cv::Point> polygon; // image coordinates of the crop handed in
        std::string text;
        double confidence = 0.0;
    };

    // Text recognition capability. One instance serves one scan and is handed to the
    // TextExtractor explicitly. Implementations may throw std::exception on failure.
    class ITextRecognizer {
    public:
        virtual ~ITextRecognizer() = default;
        virtual std::vector<RecognizedText> recognize(const cv::Mat& bgr) = 0;
    };
}
