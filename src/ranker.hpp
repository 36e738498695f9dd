#pragma once
#include "types.hpp"
#include <vector>

namespace eventseq {

// Keep sequences scoring at least score_threshold, best first.
// Exact ties keep their input order.
std::vector<ScoredSequence> rank_sequences(std::vector<ScoredSequence> sequences,
                                           double score_threshold);

} // namespace eventseq
