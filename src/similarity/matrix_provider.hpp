#pragma once
#include "similarity_matrix.hpp"
#include "../types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace eventseq {

class SimilarityClient;
class SimilarityCache;
class PairSimilarity;
struct ServiceConfig;

// Produces the event x frame similarity matrix for one candidate window.
class SimilarityMatrixProvider {
public:
    virtual ~SimilarityMatrixProvider() = default;

    // Row i scores events[i], column j scores frames[j].
    // Throws std::runtime_error when the matrix cannot be produced.
    virtual SimilarityMatrix compute(const std::vector<Event>& events,
                                     const std::vector<Frame>& frames) = 0;

    virtual std::string provider_name() const = 0;
};

// Batch provider first (retried per config), pairwise lookups as fallback.
std::unique_ptr<SimilarityMatrixProvider> create_matrix_provider(
    const ServiceConfig& config, SimilarityClient& client,
    SimilarityCache& cache, PairSimilarity& pairs);

} // namespace eventseq
