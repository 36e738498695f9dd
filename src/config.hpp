#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace eventseq {

// Tunables of the sequence search. Snapshotted by a SearchSession and
// never mutated while a search runs.
struct AlgorithmConfig {
    double similarity_threshold = 0.0;      // min similarity for a pivot or slot match
    double score_threshold = 0.0;           // min final score to keep a result
    uint32_t top_k = 10;                    // candidates from the initial retrieval
    double max_temporal_gap = 150.0;        // frame numbers; normalizes the temporal score
    int64_t search_window = 3000;           // frame-number radius around the pivot
    double min_sequence_completeness = 0.1;
    double temporal_weight = 0.3;
    double completeness_weight = 0.2;

    // Throws std::invalid_argument on a value the search cannot work with.
    void validate() const;
};

// Endpoints and call shaping for the external retrieval/similarity service.
struct ServiceConfig {
    std::string base_url = "http://localhost:8000";
    uint32_t timeout_seconds = 30;
    uint32_t batch_max_frames = 200;     // provider-side limit per batch-matrix call
    uint32_t batch_max_queries = 10;
    uint32_t batch_retries = 1;          // attempts before falling back to pairwise
    uint32_t pairwise_group_size = 5;    // single-pair lookups in flight at once
    uint32_t pairwise_group_delay_ms = 25;
};

struct Config {
    ServiceConfig service;
    AlgorithmConfig algorithm;

    // Load from ~/.eventseq/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config object; missing or mistyped fields keep their defaults.
    static Config from_json(const nlohmann::json& j);
};

nlohmann::json to_json(const AlgorithmConfig& config);

// Narrow a parsed count (e.g. --top-k) to uint32_t; throws
// std::invalid_argument unless 1 <= value <= UINT32_MAX.
uint32_t checked_count(const std::string& name, int64_t value);

} // namespace eventseq
