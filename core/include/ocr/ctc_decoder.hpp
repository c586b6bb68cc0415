#pragma once

#include <string>
#include <vector>

namespace cs {
    struct CtcResult {
        std::string text;
        double confidence = 0.0; // mean probability of the emitted characters
    };

    // Greedy CTC decoding for PaddleOCR-style recognition heads (blank at index 0).
    class CtcDecoder {
    public:
        // One character per line; index 0 is reserved for the blank token.
        bool load_dictionary(const std::string& path);

        // chars[0] must be the blank token.
        void set_dictionary(std::vector<std::string> chars);

        // Models trained with use_space_char have one extra class for ' '.
        // Appends it when the dictionary is exactly one entry short.
        bool fit_to_classes(int num_classes);

        // data: timesteps x num_classes, row-major, logits or probabilities.
        CtcResult decode(const float* data, int timesteps, int num_classes) const;

        size_t size() const { return dictionary_.size(); }

    private:
        std::vector<std::string> dictionary_;
    };
}
