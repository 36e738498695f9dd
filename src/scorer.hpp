#pragma once
#include "types.hpp"
#include "config.hpp"
#include <vector>

namespace eventseq {

// Fixed weights of the similarity, consistency and order terms.
constexpr double kBaseSimilarityWeight = 0.4;
constexpr double kConsistencyWeight = 0.1;
constexpr double kOrderWeight = 0.1;

// Composite score of a valid sequence:
//   0.4 * mean similarity
// + temporal_weight * (1 - mean(min(gap / max_temporal_gap, 1)))
// + completeness_weight * completeness (halved below the completeness floor)
// + 0.1 * max(0, 1 - stddev(similarities))
// + 0.1 * fraction of strictly increasing consecutive pairs
// The blend is not normalized. An empty sequence scores 0.
ScoredSequence score_sequence(const Sequence& sequence, size_t event_count,
                              const AlgorithmConfig& config);

// Population standard deviation; 0 for an empty list.
double standard_deviation(const std::vector<double>& values);

} // namespace eventseq
