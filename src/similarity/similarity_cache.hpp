#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <optional>
#include <utility>

namespace eventseq {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
};

// Memoizes frame/text similarity scores for the lifetime of a session.
// Keys are (frame id, normalized text), so "Person enters " and
// "person enters" share one entry. Safe for concurrent use.
class SimilarityCache {
public:
    // Look up a cached score. Returns nullopt on miss.
    std::optional<double> get(int64_t frame_id, const std::string& text);

    // Store a score.
    void put(int64_t frame_id, const std::string& text, double similarity);

    uint32_t size() const;
    CacheStats stats() const;

    // Drop every entry and reset the counters.
    void clear();

private:
    using Key = std::pair<int64_t, std::string>;

    // FNV-1a over the frame id bytes and the text. Only picks the bucket;
    // lookups still compare the full key.
    struct KeyHash {
        size_t operator()(const Key& key) const;
    };

    static Key make_key(int64_t frame_id, const std::string& text);

    std::unordered_map<Key, double, KeyHash> entries_;
    CacheStats stats_;
    mutable std::mutex mutex_;
};

} // namespace eventseq
