#include <ocr/ctc_decoder.hpp>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    // One row per timestep with `p` on the given class and the rest spread evenly.
    std::vector<float> prob_rows(const std::vector<int>& classes, int num_classes, float p) {
        std::vector<float> out;
        for (int cls : classes) {
            for (int c = 0; c < num_classes; ++c) {
                out.push_back(c == cls ? p : (1.0f - p) / static_cast<float>(num_classes - 1));
            }
        }
        return out;
    }

    cs::CtcDecoder abc_decoder() {
        cs::CtcDecoder d;
        d.set_dictionary({"", "A", "B", "C"});
        return d;
    }

    void test_collapses_repeats_and_blanks() {
        const auto d = abc_decoder();
        // A A _ A B B _ C -> "AABC"
        const auto rows = prob_rows({1, 1, 0, 1, 2, 2, 0, 3}, 4, 0.9f);
        const auto r = d.decode(rows.data(), 8, 4);
        check(r.text == "AABC", "repeats collapse unless separated by a blank, got '" + r.text + "'");
        check(std::fabs(r.confidence - 0.9) < 1e-5, "confidence is the mean probability of emitted characters");
    }

    void test_logits_are_softmaxed() {
        const auto d = abc_decoder();
        const std::vector<float> logits = {
            -2.0f, 5.0f, -1.0f, 0.0f,  // A
            6.0f, 0.0f, 0.0f, 0.0f,    // blank
            0.0f, 0.0f, 0.0f, 7.0f,    // C
        };
        const auto r = d.decode(logits.data(), 3, 4);
        check(r.text == "AC", "raw logits should decode the same as probabilities");
        check(r.confidence > 0.9 && r.confidence <= 1.0, "softmaxed confidence should be a probability");
    }

    void test_all_blank_is_empty() {
        const auto d = abc_decoder();
        const auto rows = prob_rows({0, 0, 0}, 4, 0.97f);
        const auto r = d.decode(rows.data(), 3, 4);
        check(r.text.empty(), "only blanks decode to empty text");
        check(r.confidence == 0.0, "empty text has zero confidence");
        check(d.decode(nullptr, 3, 4).text.empty(), "null data decodes to empty text");
    }

    void test_dictionary_file_and_space_class() {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() / ("cs_keys_" + std::to_string(stamp) + ".txt");
        {
            std::ofstream out(path);
            out << "a\r\nb\nc\n";
        }

        cs::CtcDecoder d;
        check(d.load_dictionary(path.string()), "dictionary file should load");
        fs::remove(path);
        check(d.size() == 4, "dictionary gets a leading blank entry");

        check(d.fit_to_classes(5), "one missing class is the space character");
        check(d.size() == 5, "space class appended");
        const auto rows = prob_rows({1, 5 - 1, 2}, 5, 0.9f);
        check(d.decode(rows.data(), 3, 5).text == "a b", "the appended class decodes as a space");

        check(!d.fit_to_classes(9), "a dictionary far off the class count is rejected");
        check(!cs::CtcDecoder().load_dictionary("/nonexistent/keys.txt"), "missing dictionary file fails");
    }
}

int main() {
    test_collapses_repeats_and_blanks();
    test_logits_are_softmaxed();
    test_all_blank_is_empty();
    test_dictionary_file_and_space_class();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all ctc decoder tests passed\n";
    return 0;
}
