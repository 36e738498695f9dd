#include "batch_matrix.hpp"
#include "similarity_cache.hpp"
#include "similarity_client.hpp"
#include <algorithm>
#include <stdexcept>

namespace eventseq {

BatchMatrixProvider::BatchMatrixProvider(SimilarityClient& client, SimilarityCache* cache,
                                         uint32_t max_frames, uint32_t max_queries)
    : client_(client)
    , cache_(cache)
    , max_frames_(max_frames == 0 ? 1 : max_frames)
    , max_queries_(max_queries == 0 ? 1 : max_queries)
{}

SimilarityMatrix BatchMatrixProvider::compute(const std::vector<Event>& events,
                                              const std::vector<Frame>& frames) {
    SimilarityMatrix matrix(events.size(), frames.size());
    if (events.empty() || frames.empty()) return matrix;

    for (size_t q0 = 0; q0 < events.size(); q0 += max_queries_) {
        size_t q1 = std::min(events.size(), q0 + max_queries_);
        std::vector<std::string> texts;
        texts.reserve(q1 - q0);
        for (size_t q = q0; q < q1; ++q) texts.push_back(events[q].description);

        for (size_t f0 = 0; f0 < frames.size(); f0 += max_frames_) {
            size_t f1 = std::min(frames.size(), f0 + max_frames_);
            std::vector<int64_t> ids;
            ids.reserve(f1 - f0);
            for (size_t f = f0; f < f1; ++f) ids.push_back(frames[f].id);

            SimilarityMatrix tile = client_.batch_matrix(ids, texts);
            if (tile.rows() != texts.size() || tile.cols() != ids.size()) {
                throw std::runtime_error("batch-matrix tile has shape " +
                                         std::to_string(tile.rows()) + "x" +
                                         std::to_string(tile.cols()) + ", expected " +
                                         std::to_string(texts.size()) + "x" +
                                         std::to_string(ids.size()));
            }

            for (size_t q = 0; q < tile.rows(); ++q) {
                for (size_t f = 0; f < tile.cols(); ++f) {
                    double score = tile.at(q, f);
                    matrix.set(q0 + q, f0 + f, score);
                    if (cache_) cache_->put(ids[f], texts[q], score);
                }
            }
        }
    }

    return matrix;
}

} // namespace eventseq
