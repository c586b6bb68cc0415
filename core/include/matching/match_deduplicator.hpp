#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace cs {
    constexpr double kDefaultMinGapMs = 5000.0;
    // Chapter timestamps have one-second resolution; a smaller gap could keep two
    // matches that print the same M:SS line.
    constexpr double kMinGapFloorMs = 1000.0;

    struct MatchCandidate {
        int64_t frame_index = 0;
        double timestamp_ms = 0.0;
        cv::Point location;
        double confidence = 0.0;
    };

    // A candidate kept as the representative of one on-screen event.
    struct DeduplicatedMatch {
        int64_t frame_index = 0;
        double timestamp_ms = 0.0;
        cv::Point location;
        double confidence = 0.0;
    };

    // Greedy first-wins gap enforcement: a candidate is accepted when it is at least
    // min_gap_ms after the last accepted one. Candidates must be offered in increasing
    // timestamp order; the first one is always accepted.
    // Throws std::invalid_argument when min_gap_ms is below kMinGapFloorMs.
    class MatchDeduplicator {
    public:
        explicit MatchDeduplicator(double min_gap_ms = kDefaultMinGapMs);

        std::optional<DeduplicatedMatch> offer(const MatchCandidate& c);
        void reset();

        double min_gap_ms() const { return min_gap_ms_; }

    private:
        double min_gap_ms_;
        double last_accepted_ms_;
    };

    // Batch form of MatchDeduplicator over candidates ordered by frame index.
    std::vector<DeduplicatedMatch> dedupe(const std::vector<MatchCandidate>& candidates,
                                          double min_gap_ms = kDefaultMinGapMs);
}
