#include "ranker.hpp"
#include <algorithm>

namespace eventseq {

std::vector<ScoredSequence> rank_sequences(std::vector<ScoredSequence> sequences,
                                           double score_threshold) {
    sequences.erase(std::remove_if(sequences.begin(), sequences.end(),
                                   [score_threshold](const ScoredSequence& s) {
                                       return s.score < score_threshold;
                                   }),
                    sequences.end());

    std::stable_sort(sequences.begin(), sequences.end(),
                     [](const ScoredSequence& a, const ScoredSequence& b) {
                         return a.score > b.score;
                     });
    return sequences;
}

} // namespace eventseq
