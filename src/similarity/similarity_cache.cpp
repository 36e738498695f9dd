#include "similarity_cache.hpp"
#include "../util.hpp"

namespace eventseq {

size_t SimilarityCache::KeyHash::operator()(const Key& key) const {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime  = 1099511628211ULL;

    uint64_t hash = fnv_offset;

    auto id = static_cast<uint64_t>(key.first);
    for (int shift = 0; shift < 64; shift += 8) {
        hash ^= (id >> shift) & 0xffU;
        hash *= fnv_prime;
    }

    for (unsigned char byte : key.second) {
        hash ^= byte;
        hash *= fnv_prime;
    }

    return static_cast<size_t>(hash);
}

SimilarityCache::Key SimilarityCache::make_key(int64_t frame_id, const std::string& text) {
    return {frame_id, normalize_text(text)};
}

std::optional<double> SimilarityCache::get(int64_t frame_id, const std::string& text) {
    Key key = make_key(frame_id, text);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.misses++;
        return std::nullopt;
    }
    stats_.hits++;
    return it->second;
}

void SimilarityCache::put(int64_t frame_id, const std::string& text, double similarity) {
    Key key = make_key(frame_id, text);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[std::move(key)] = similarity;
}

uint32_t SimilarityCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

CacheStats SimilarityCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SimilarityCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    stats_ = CacheStats{};
}

} // namespace eventseq
