#include <matching/match_deduplicator.hpp>

#include <stdexcept>
#include <string>

namespace cs {
    MatchDeduplicator::MatchDeduplicator(double min_gap_ms)
        : min_gap_ms_(min_gap_ms),
          last_accepted_ms_(-min_gap_ms) {
        if (!(min_gap_ms >= kMinGapFloorMs)) {
            throw std::invalid_argument("min_gap_ms must be >= " +
                                        std::to_string(static_cast<int>(kMinGapFloorMs)) +
                                        ", got " + std::to_string(min_gap_ms));
        }
    }

    std::optional<DeduplicatedMatch> MatchDeduplicator::offer(const MatchCandidate& c) {
        if (c.timestamp_ms - last_accepted_ms_ < min_gap_ms_) return std::nullopt;

        last_accepted_ms_ = c.timestamp_ms;

        DeduplicatedMatch m;
        m.frame_index = c.frame_index;
        m.timestamp_ms = c.timestamp_ms;
        m.location = c.location;
        m.confidence = c.confidence;
        return m;
    }

    void MatchDeduplicator::reset() {
        last_accepted_ms_ = -min_gap_ms_;
    }

    std::vector<DeduplicatedMatch> dedupe(const std::vector<MatchCandidate>& candidates,
                                          double min_gap_ms) {
        MatchDeduplicator d(min_gap_ms);
        std::vector<DeduplicatedMatch> out;
        for (const auto& c : candidates) {
            if (auto m = d.offer(c)) out.push_back(*m);
        }
        return out;
    }
}
