#include <ocr/ctc_decoder.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <utility>

namespace cs {
    bool CtcDecoder::load_dictionary(const std::string& path) {
        std::ifstream file(path);
        if (!file.good()) return false;

        std::vector<std::string> chars;
        chars.emplace_back(); // blank

        std::string line;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            chars.push_back(line);
        }
        if (chars.size() < 2) return false;

        dictionary_ = std::move(chars);
        return true;
    }

    void CtcDecoder::set_dictionary(std::vector<std::string> chars) {
        dictionary_ = std::move(chars);
    }

    bool CtcDecoder::fit_to_classes(int num_classes) {
        if (num_classes <= 0 || dictionary_.empty()) return false;

        const int n = static_cast<int>(dictionary_.size());
        if (n == num_classes) return true;
        if (n == num_classes - 1) {
            dictionary_.emplace_back(" ");
            return true;
        }
        return false;
    }

    CtcResult CtcDecoder::decode(const float* data, int timesteps, int num_classes) const {
        CtcResult result;
        if (!data || timesteps <= 0 || num_classes <= 0) return result;

        std::vector<float> probs(static_cast<size_t>(num_classes));
        int last_idx = -1;
        double conf_sum = 0.0;
        int emitted = 0;

        for (int t = 0; t < timesteps; ++t) {
            const float* row = data + static_cast<size_t>(t) * static_cast<size_t>(num_classes);

            const float max_v = *std::max_element(row, row + num_classes);
            const float min_v = *std::min_element(row, row + num_classes);
            float sum_v = 0.0f;
            for (int c = 0; c < num_classes; ++c) sum_v += row[c];

            // some exports end with a softmax layer already
            const bool already_probs = min_v >= -1e-4f && max_v <= 1.0f + 1e-3f &&
                                       std::fabs(sum_v - 1.0f) < 1e-2f;
            if (already_probs) {
                std::copy(row, row + num_classes, probs.begin());
            } else {
                float sum_exp = 0.0f;
                for (int c = 0; c < num_classes; ++c) {
                    probs[c] = std::exp(row[c] - max_v);
                    sum_exp += probs[c];
                }
                for (int c = 0; c < num_classes; ++c) probs[c] /= sum_exp;
            }

            const auto best = std::max_element(probs.begin(), probs.end());
            const int idx = static_cast<int>(best - probs.begin());

            if (idx != 0 && idx != last_idx && idx < static_cast<int>(dictionary_.size())) {
                result.text += dictionary_[static_cast<size_t>(idx)];
                conf_sum += *best;
                ++emitted;
            }
            last_idx = idx;
        }

        if (emitted > 0) result.confidence = conf_sum / emitted;
        return result;
    }
}
