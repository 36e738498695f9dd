#pragma once
#include "matrix_provider.hpp"
#include <cstdint>

namespace eventseq {

// Fast path: one batch-matrix call per tile of at most
// max_queries x max_frames. Small windows need a single call.
// Any failing tile fails the whole matrix.
class BatchMatrixProvider : public SimilarityMatrixProvider {
public:
    // cache may be null; when set, every computed score is stored in it.
    BatchMatrixProvider(SimilarityClient& client, SimilarityCache* cache,
                        uint32_t max_frames = 200, uint32_t max_queries = 10);

    SimilarityMatrix compute(const std::vector<Event>& events,
                             const std::vector<Frame>& frames) override;

    std::string provider_name() const override { return "batch"; }

private:
    SimilarityClient& client_;
    SimilarityCache* cache_;
    uint32_t max_frames_;
    uint32_t max_queries_;
};

} // namespace eventseq
