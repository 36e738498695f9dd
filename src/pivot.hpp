#pragma once
#include "types.hpp"
#include <vector>

namespace eventseq {

class PairSimilarity;

struct PivotMatch {
    uint32_t event_index = 0;
    double similarity = 0.0;  // candidate vs. its best event
    Frame frame;              // the candidate itself
};

// Score the candidate against every event with single-pair lookups and keep
// the best event. Equal maxima resolve to the lowest event index.
// Throws std::invalid_argument when events is empty.
PivotMatch select_pivot(const Frame& candidate, const std::vector<Event>& events,
                        PairSimilarity& similarity);

} // namespace eventseq
