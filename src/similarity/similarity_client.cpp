#include "similarity_client.hpp"
#include "../frame_source.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace eventseq {

HttpSimilarityClient::HttpSimilarityClient(std::string base_url, HttpClient& http,
                                           long timeout_seconds)
    : base_url_(std::move(base_url))
    , http_(http)
    , timeout_seconds_(timeout_seconds)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

double clamp_similarity(double value) {
    if (!std::isfinite(value)) return 0.0;
    return std::min(1.0, std::max(0.0, value));
}

double HttpSimilarityClient::frame_text(int64_t frame_id, const std::string& text) {
    std::string url = base_url_ + "/similarity/frame-text?frame_id=" +
                      std::to_string(frame_id) + "&text_query=" + url_encode(text);

    auto response = http_.post(url, "", {{"Accept", "application/json"}}, timeout_seconds_);
    if (!response.ok()) {
        throw std::runtime_error("frame-text similarity failed for frame " +
                                 std::to_string(frame_id) + ": " +
                                 describe_failure(response.status_code, response.body));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        return clamp_similarity(j.at("similarity").get<double>());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("frame-text similarity response is malformed: ") +
                                 e.what());
    }
}

SimilarityMatrix HttpSimilarityClient::batch_matrix(const std::vector<int64_t>& frame_ids,
                                                    const std::vector<std::string>& texts) {
    nlohmann::json body = {
        {"frame_ids", frame_ids},
        {"text_queries", texts}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json"}
    };

    auto response = http_.post(base_url_ + "/similarity/batch-matrix",
                               body.dump(), headers, timeout_seconds_);
    if (!response.ok()) {
        throw std::runtime_error("batch-matrix similarity failed: " +
                                 describe_failure(response.status_code, response.body));
    }

    nlohmann::json rows;
    try {
        auto j = nlohmann::json::parse(response.body);
        rows = j.at("similarity_matrix");
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("batch-matrix response is malformed: ") + e.what());
    }

    if (!rows.is_array() || rows.size() != texts.size()) {
        throw std::runtime_error("batch-matrix returned " + std::to_string(rows.size()) +
                                 " rows, expected " + std::to_string(texts.size()));
    }

    SimilarityMatrix matrix(texts.size(), frame_ids.size());
    for (size_t q = 0; q < rows.size(); ++q) {
        const auto& row = rows[q];
        if (!row.is_array() || row.size() != frame_ids.size()) {
            throw std::runtime_error("batch-matrix row " + std::to_string(q) +
                                     " has the wrong number of columns");
        }
        for (size_t f = 0; f < row.size(); ++f) {
            if (!row[f].is_number()) {
                throw std::runtime_error("batch-matrix contains a non-numeric score");
            }
            matrix.set(q, f, clamp_similarity(row[f].get<double>()));
        }
    }
    return matrix;
}

} // namespace eventseq
