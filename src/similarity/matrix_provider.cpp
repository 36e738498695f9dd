#include "matrix_provider.hpp"
#include "batch_matrix.hpp"
#include "pairwise_matrix.hpp"
#include "fallback_matrix.hpp"
#include "../config.hpp"

namespace eventseq {

std::unique_ptr<SimilarityMatrixProvider> create_matrix_provider(
    const ServiceConfig& config, SimilarityClient& client,
    SimilarityCache& cache, PairSimilarity& pairs) {
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    chain.push_back(std::make_unique<BatchMatrixProvider>(
        client, &cache, config.batch_max_frames, config.batch_max_queries));
    chain.push_back(std::make_unique<PairwiseMatrixProvider>(
        pairs, config.pairwise_group_size,
        std::chrono::milliseconds(config.pairwise_group_delay_ms)));

    uint32_t retries = config.batch_retries == 0 ? 1 : config.batch_retries;
    return std::make_unique<FallbackMatrixProvider>(std::move(chain), retries);
}

} // namespace eventseq
