#include "pair_similarity.hpp"
#include "similarity_cache.hpp"
#include "similarity_client.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace eventseq {

PairSimilarity::PairSimilarity(SimilarityClient& client, SimilarityCache& cache)
    : client_(client), cache_(cache) {}

double PairSimilarity::fallback_similarity(const Frame& frame) {
    return clamp_similarity(std::min(frame.similarity * 0.9, 1.0));
}

double PairSimilarity::lookup(const Frame& frame, const std::string& text) {
    if (auto cached = cache_.get(frame.id, text)) {
        return *cached;
    }

    try {
        double similarity = client_.frame_text(frame.id, text);
        cache_.put(frame.id, text, similarity);
        return similarity;
    } catch (const std::exception& e) {
        double fallback = fallback_similarity(frame);
        std::cerr << "[similarity] Lookup failed for frame " << frame.id
                  << " / \"" << text << "\": " << e.what()
                  << " (using fallback " << fallback << ")\n";
        return fallback;
    }
}

} // namespace eventseq
