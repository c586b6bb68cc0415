#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <ocr/text_recognizer.hpp>

namespace cs {
    struct PaddleOcrConfig {
        std::string det_param_path = "models/ocr/det.param";
        std::string det_bin_path = "models/ocr/det.bin";
        std::string rec_param_path = "models/ocr/rec.param";
        std::string rec_bin_path = "models/ocr/rec.bin";
        std::string dict_path = "models/ocr/keys.txt";

        std::string det_input = "in0";
        std::string det_output = "out0";
        std::string rec_input = "in0";
        std::string rec_output = "out0";

        int det_max_side = 960;
        float det_bin_thresh = 0.3f;  // probability map binarization
        float det_box_thresh = 0.6f;  // mean probability inside a box
        float det_unclip_ratio = 1.5f;
        int det_min_size = 3;

        int rec_height = 48;
        int rec_max_width = 1280;

        int ncnn_threads = 1;
    };

    // PP-OCR text detection + CTC recognition networks run through ncnn.
    class PaddleOcrRecognizer final : public ITextRecognizer {
    public:
        // Throws std::runtime_error if a model or the dictionary cannot be loaded.
        explicit PaddleOcrRecognizer(PaddleOcrConfig cfg);
        ~PaddleOcrRecognizer() override;

        PaddleOcrRecognizer(const PaddleOcrRecognizer&) = delete;
        PaddleOcrRecognizer& operator=(const PaddleOcrRecognizer&) = delete;

        std::vector<RecognizedText> recognize(const cv::Mat& bgr) override;

    private:
        PaddleOcrConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
