#include "scorer.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace eventseq {

double standard_deviation(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = std::accumulate(values.begin(), values.end(), 0.0) /
                  static_cast<double>(values.size());
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    return std::sqrt(sq / static_cast<double>(values.size()));
}

ScoredSequence score_sequence(const Sequence& sequence, size_t event_count,
                              const AlgorithmConfig& config) {
    ScoredSequence result;
    result.slots = assigned_slots(sequence);
    const Sequence& slots = result.slots;
    if (slots.empty() || event_count == 0) return result;

    std::vector<double> similarities;
    similarities.reserve(slots.size());
    for (const auto& s : slots) similarities.push_back(s.similarity);

    ScoreBreakdown& b = result.breakdown;

    b.base_similarity = std::accumulate(similarities.begin(), similarities.end(), 0.0) /
                        static_cast<double>(similarities.size());

    b.temporal = 1.0;
    b.order = 1.0;
    if (slots.size() > 1) {
        double gap_penalty = 0.0;
        size_t ordered_pairs = 0;
        for (size_t i = 1; i < slots.size(); ++i) {
            auto gap = static_cast<double>(slots[i].frame_number - slots[i - 1].frame_number);
            gap_penalty += std::min(gap / config.max_temporal_gap, 1.0);
            if (slots[i].frame_number > slots[i - 1].frame_number) ordered_pairs++;
        }
        double pairs = static_cast<double>(slots.size() - 1);
        b.temporal = std::max(0.0, 1.0 - gap_penalty / pairs);
        b.order = static_cast<double>(ordered_pairs) / pairs;
    }

    double completeness = static_cast<double>(slots.size()) / static_cast<double>(event_count);
    b.completeness = completeness >= config.min_sequence_completeness
        ? completeness
        : completeness * 0.5;

    b.consistency = std::max(0.0, 1.0 - standard_deviation(similarities));

    result.score = kBaseSimilarityWeight * b.base_similarity +
                   config.temporal_weight * b.temporal +
                   config.completeness_weight * b.completeness +
                   kConsistencyWeight * b.consistency +
                   kOrderWeight * b.order;

    auto [lo, hi] = std::minmax_element(slots.begin(), slots.end(),
        [](const SequenceSlot& x, const SequenceSlot& y) {
            return x.frame_number < y.frame_number;
        });
    SequenceMetadata& m = result.metadata;
    m.video_id = slots.front().video_id;
    m.start_frame = lo->frame_number;
    m.end_frame = hi->frame_number;
    m.duration = m.end_frame - m.start_frame;
    m.completeness = completeness;

    return result;
}

} // namespace eventseq
