#pragma once
#include "../types.hpp"
#include <string>

namespace eventseq {

class SimilarityClient;
class SimilarityCache;

// Single-pair similarity lookup through the session cache.
// Never throws: a failed lookup is logged and answered with
// fallback_similarity(frame), which is not cached.
class PairSimilarity {
public:
    PairSimilarity(SimilarityClient& client, SimilarityCache& cache);

    double lookup(const Frame& frame, const std::string& text);

    // Conservative stand-in derived from the frame's own retrieval score.
    static double fallback_similarity(const Frame& frame);

    SimilarityCache& cache() { return cache_; }

private:
    SimilarityClient& client_;
    SimilarityCache& cache_;
};

} // namespace eventseq
