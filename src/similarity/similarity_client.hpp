#pragma once
#include "similarity_matrix.hpp"
#include "../http.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace eventseq {

// External frame/text similarity service. Scores are in [0, 1].
// Implementations throw std::runtime_error on any failure.
class SimilarityClient {
public:
    virtual ~SimilarityClient() = default;

    // Score one (frame, text) pair.
    virtual double frame_text(int64_t frame_id, const std::string& text) = 0;

    // Score every (text, frame) pair in one call. Rows follow `texts`,
    // columns follow `frame_ids`.
    virtual SimilarityMatrix batch_matrix(const std::vector<int64_t>& frame_ids,
                                          const std::vector<std::string>& texts) = 0;
};

// REST client:
//   POST {base}/similarity/frame-text?frame_id=..&text_query=..
//   POST {base}/similarity/batch-matrix  {"frame_ids":[..],"text_queries":[..]}
class HttpSimilarityClient : public SimilarityClient {
public:
    HttpSimilarityClient(std::string base_url, HttpClient& http, long timeout_seconds = 30);

    double frame_text(int64_t frame_id, const std::string& text) override;
    SimilarityMatrix batch_matrix(const std::vector<int64_t>& frame_ids,
                                  const std::vector<std::string>& texts) override;

private:
    std::string base_url_;
    HttpClient& http_;
    long timeout_seconds_;
};

// Clamp a service score into [0, 1].
double clamp_similarity(double value);

} // namespace eventseq
