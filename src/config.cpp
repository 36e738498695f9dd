#include "config.hpp"
#include "util.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace eventseq {

void AlgorithmConfig::validate() const {
    auto finite = [](double v) { return std::isfinite(v); };
    if (!finite(similarity_threshold) || !finite(score_threshold) ||
        !finite(max_temporal_gap) || !finite(min_sequence_completeness) ||
        !finite(temporal_weight) || !finite(completeness_weight)) {
        throw std::invalid_argument("algorithm config contains a non-finite value");
    }
    if (top_k == 0)
        throw std::invalid_argument("top_k must be at least 1");
    if (max_temporal_gap <= 0.0)
        throw std::invalid_argument("max_temporal_gap must be positive");
    if (search_window < 0)
        throw std::invalid_argument("search_window must not be negative");
    if (min_sequence_completeness < 0.0 || min_sequence_completeness > 1.0)
        throw std::invalid_argument("min_sequence_completeness must be within [0, 1]");
    if (temporal_weight < 0.0 || completeness_weight < 0.0)
        throw std::invalid_argument("score weights must not be negative");
}

uint32_t checked_count(const std::string& name, int64_t value) {
    if (value <= 0 || static_cast<uint64_t>(value) > std::numeric_limits<uint32_t>::max())
        throw std::invalid_argument(name + " must be between 1 and " +
                                    std::to_string(std::numeric_limits<uint32_t>::max()));
    return static_cast<uint32_t>(value);
}

nlohmann::json Config::defaults_json() {
    return {
        {"service", {
            {"base_url", "http://localhost:8000"},
            {"timeout_seconds", 30},
            {"batch_max_frames", 200},
            {"batch_max_queries", 10},
            {"batch_retries", 1},
            {"pairwise_group_size", 5},
            {"pairwise_group_delay_ms", 25}
        }},
        {"algorithm", {
            {"similarity_threshold", 0.0},
            {"score_threshold", 0.0},
            {"top_k", 10},
            {"max_temporal_gap", 150},
            {"search_window", 3000},
            {"min_sequence_completeness", 0.1},
            {"temporal_weight", 0.3},
            {"completeness_weight", 0.2}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Values outside [0, UINT32_MAX] are rejected like any other mistyped field.
static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    const auto& value = obj[key];
    constexpr uint64_t limit = std::numeric_limits<uint32_t>::max();
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v <= limit) out = static_cast<uint32_t>(v);
    } else {
        int64_t v = value.get<int64_t>();
        if (v >= 0 && static_cast<uint64_t>(v) <= limit) out = static_cast<uint32_t>(v);
    }
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("service") && j["service"].is_object()) {
        auto& s = j["service"];
        if (s.contains("base_url") && s["base_url"].is_string())
            cfg.service.base_url = s["base_url"].get<std::string>();
        read_uint(s, "timeout_seconds", cfg.service.timeout_seconds);
        read_uint(s, "batch_max_frames", cfg.service.batch_max_frames);
        read_uint(s, "batch_max_queries", cfg.service.batch_max_queries);
        read_uint(s, "batch_retries", cfg.service.batch_retries);
        read_uint(s, "pairwise_group_size", cfg.service.pairwise_group_size);
        read_uint(s, "pairwise_group_delay_ms", cfg.service.pairwise_group_delay_ms);
    }

    if (j.contains("algorithm") && j["algorithm"].is_object()) {
        auto& a = j["algorithm"];
        read_double(a, "similarity_threshold", cfg.algorithm.similarity_threshold);
        read_double(a, "score_threshold", cfg.algorithm.score_threshold);
        read_uint(a, "top_k", cfg.algorithm.top_k);
        read_double(a, "max_temporal_gap", cfg.algorithm.max_temporal_gap);
        if (a.contains("search_window") && a["search_window"].is_number_integer())
            cfg.algorithm.search_window = a["search_window"].get<int64_t>();
        read_double(a, "min_sequence_completeness", cfg.algorithm.min_sequence_completeness);
        read_double(a, "temporal_weight", cfg.algorithm.temporal_weight);
        read_double(a, "completeness_weight", cfg.algorithm.completeness_weight);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.eventseq/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json on_disk = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(on_disk, defaults_json());
            if (j != on_disk) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("EVENTSEQ_BASE_URL"))
        cfg.service.base_url = v;
    if (const char* v = std::getenv("EVENTSEQ_TIMEOUT")) {
        char* end = nullptr;
        unsigned long t = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && v[0] != '-' && t > 0 &&
            t <= std::numeric_limits<uint32_t>::max())
            cfg.service.timeout_seconds = static_cast<uint32_t>(t);
    }

    return cfg;
}

nlohmann::json to_json(const AlgorithmConfig& config) {
    return {
        {"similarity_threshold", config.similarity_threshold},
        {"score_threshold", config.score_threshold},
        {"top_k", config.top_k},
        {"max_temporal_gap", config.max_temporal_gap},
        {"search_window", config.search_window},
        {"min_sequence_completeness", config.min_sequence_completeness},
        {"temporal_weight", config.temporal_weight},
        {"completeness_weight", config.completeness_weight}
    };
}

} // namespace eventseq
