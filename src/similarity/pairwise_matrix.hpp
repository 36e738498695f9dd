#pragma once
#include "matrix_provider.hpp"
#include <chrono>
#include <cstdint>

namespace eventseq {

// Slow path: one frame-text lookup per (event, frame) pair, issued in
// concurrent groups of group_size with group_delay between groups so the
// service is never hit by every pair at once. Lookups go through the
// session cache. A failed lookup degrades to the pair fallback; compute()
// itself does not throw for a single bad pair.
class PairwiseMatrixProvider : public SimilarityMatrixProvider {
public:
    PairwiseMatrixProvider(PairSimilarity& pairs, uint32_t group_size = 5,
                           std::chrono::milliseconds group_delay = std::chrono::milliseconds(25));

    SimilarityMatrix compute(const std::vector<Event>& events,
                             const std::vector<Frame>& frames) override;

    std::string provider_name() const override { return "pairwise"; }

private:
    PairSimilarity& pairs_;
    uint32_t group_size_;
    std::chrono::milliseconds group_delay_;
};

} // namespace eventseq
