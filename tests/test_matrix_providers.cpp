#include <catch2/catch_test_macros.hpp>
#include "similarity/batch_matrix.hpp"
#include "similarity/pairwise_matrix.hpp"
#include "similarity/fallback_matrix.hpp"
#include "similarity/pair_similarity.hpp"
#include "similarity/similarity_cache.hpp"
#include "config.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace eventseq;

static std::vector<Frame> frames_1_to(int64_t n) {
    std::vector<Frame> frames;
    for (int64_t i = 1; i <= n; ++i) frames.push_back(make_frame(i, "v1", i * 10, 0.5));
    return frames;
}

// Fails a fixed number of times, then returns a matrix filled with `value`.
class FlakyProvider : public SimilarityMatrixProvider {
public:
    FlakyProvider(std::string name, int failures, double value)
        : name_(std::move(name)), failures_(failures), value_(value) {}

    SimilarityMatrix compute(const std::vector<Event>& events,
                             const std::vector<Frame>& frames) override {
        calls++;
        if (failures_-- > 0) throw std::runtime_error(name_ + " unavailable");
        return SimilarityMatrix(events.size(), frames.size(), value_);
    }

    std::string provider_name() const override { return name_; }

    int calls = 0;

private:
    std::string name_;
    int failures_;
    double value_;
};

// ── BatchMatrixProvider ─────────────────────────────────────────

TEST_CASE("BatchMatrixProvider: small window is a single call", "[matrix]") {
    FakeSimilarityClient client;
    client.set(2, "b", 0.9);
    SimilarityCache cache;
    BatchMatrixProvider provider(client, &cache);

    auto events = make_events({"a", "b"});
    auto m = provider.compute(events, frames_1_to(3));

    REQUIRE(client.batch_calls == 1);
    REQUIRE(m.rows() == 2);
    REQUIRE(m.cols() == 3);
    REQUIRE(m.at(1, 1) == 0.9);
    REQUIRE(m.at(0, 1) == 0.0);
}

TEST_CASE("BatchMatrixProvider: tiles by frame and query limits", "[matrix]") {
    FakeSimilarityClient client;
    client.set(5, "c", 0.7);
    BatchMatrixProvider provider(client, nullptr, 2, 2);

    auto events = make_events({"a", "b", "c"});
    auto m = provider.compute(events, frames_1_to(5));

    // 2 query tiles x 3 frame tiles
    REQUIRE(client.batch_calls == 6);
    for (const auto& [queries, frames] : client.batch_shapes) {
        REQUIRE(queries <= 2);
        REQUIRE(frames <= 2);
    }
    REQUIRE(m.rows() == 3);
    REQUIRE(m.cols() == 5);
    REQUIRE(m.at(2, 4) == 0.7);
}

TEST_CASE("BatchMatrixProvider: scores land in the cache", "[matrix]") {
    FakeSimilarityClient client;
    client.set(1, "a", 0.4);
    SimilarityCache cache;
    BatchMatrixProvider provider(client, &cache);

    provider.compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(cache.size() == 4);
    REQUIRE(cache.get(1, "a").value_or(-1.0) == 0.4);
}

TEST_CASE("BatchMatrixProvider: failure propagates", "[matrix]") {
    FakeSimilarityClient client;
    client.batch_fails = true;
    BatchMatrixProvider provider(client, nullptr);
    REQUIRE_THROWS_AS(provider.compute(make_events({"a", "b"}), frames_1_to(2)),
                      std::runtime_error);
}

TEST_CASE("BatchMatrixProvider: empty frame list makes no call", "[matrix]") {
    FakeSimilarityClient client;
    BatchMatrixProvider provider(client, nullptr);
    auto m = provider.compute(make_events({"a", "b"}), {});
    REQUIRE(client.batch_calls == 0);
    REQUIRE(m.cols() == 0);
}

// ── PairwiseMatrixProvider ──────────────────────────────────────

TEST_CASE("PairwiseMatrixProvider: one lookup per pair", "[matrix]") {
    FakeSimilarityClient client;
    client.set(3, "b", 0.8);
    SimilarityCache cache;
    PairSimilarity pairs(client, cache);
    PairwiseMatrixProvider provider(pairs, 2, std::chrono::milliseconds(0));

    auto m = provider.compute(make_events({"a", "b"}), frames_1_to(5));
    REQUIRE(client.frame_text_calls == 10);
    REQUIRE(m.at(1, 2) == 0.8);
    REQUIRE(cache.size() == 10);
}

TEST_CASE("PairwiseMatrixProvider: cached pairs are not refetched", "[matrix]") {
    FakeSimilarityClient client;
    SimilarityCache cache;
    cache.put(1, "a", 0.33);
    PairSimilarity pairs(client, cache);
    PairwiseMatrixProvider provider(pairs, 5, std::chrono::milliseconds(0));

    auto m = provider.compute(make_events({"a"}), frames_1_to(3));
    REQUIRE(client.frame_text_calls == 2);
    REQUIRE(m.at(0, 0) == 0.33);
}

TEST_CASE("PairwiseMatrixProvider: failed lookups use the fallback", "[matrix]") {
    FakeSimilarityClient client;
    client.default_score = 0.2;
    client.failing_frames.insert(2);
    SimilarityCache cache;
    PairSimilarity pairs(client, cache);
    PairwiseMatrixProvider provider(pairs, 5, std::chrono::milliseconds(1));

    auto frames = frames_1_to(3);
    auto m = provider.compute(make_events({"a", "b"}), frames);
    REQUIRE(m.at(0, 0) == 0.2);
    REQUIRE(m.at(0, 1) == PairSimilarity::fallback_similarity(frames[1]));
    REQUIRE(m.at(1, 1) == PairSimilarity::fallback_similarity(frames[1]));
    REQUIRE(m.at(1, 2) == 0.2);
}

// Records how many frame_text calls overlap in time.
class InFlightCountingClient : public SimilarityClient {
public:
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> calls{0};

    double frame_text(int64_t, const std::string&) override {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(15));
        --in_flight;
        return 0.5;
    }

    SimilarityMatrix batch_matrix(const std::vector<int64_t>&,
                                  const std::vector<std::string>&) override {
        throw std::runtime_error("batch not supported");
    }
};

TEST_CASE("PairwiseMatrixProvider: never more than group_size lookups in flight", "[matrix]") {
    InFlightCountingClient client;
    SimilarityCache cache;
    PairSimilarity pairs(client, cache);
    PairwiseMatrixProvider provider(pairs, 3, std::chrono::milliseconds(0));

    auto m = provider.compute(make_events({"a", "b"}), frames_1_to(20));
    REQUIRE(client.calls.load() == 40);
    REQUIRE(client.max_in_flight.load() >= 1);
    REQUIRE(client.max_in_flight.load() <= 3);
    REQUIRE(client.in_flight.load() == 0);
    REQUIRE(m.at(1, 19) == 0.5);
}

TEST_CASE("PairwiseMatrixProvider: waits group_delay between groups", "[matrix]") {
    InFlightCountingClient client;
    SimilarityCache cache;
    PairSimilarity pairs(client, cache);
    const auto delay = std::chrono::milliseconds(30);
    PairwiseMatrixProvider provider(pairs, 3, delay);

    // 7 frames in groups of 3: three groups, two pauses.
    auto start = std::chrono::steady_clock::now();
    provider.compute(make_events({"a"}), frames_1_to(7));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(client.calls.load() == 7);
    REQUIRE(client.max_in_flight.load() <= 3);
    REQUIRE(elapsed >= 2 * delay);
}

// ── FallbackMatrixProvider ──────────────────────────────────────

TEST_CASE("FallbackMatrixProvider: first provider succeeds", "[matrix]") {
    auto primary = std::make_unique<FlakyProvider>("primary", 0, 0.5);
    auto secondary = std::make_unique<FlakyProvider>("secondary", 0, 0.1);
    auto* secondary_ptr = secondary.get();

    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    chain.push_back(std::move(primary));
    chain.push_back(std::move(secondary));
    FallbackMatrixProvider provider(std::move(chain));

    auto m = provider.compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(m.at(0, 0) == 0.5);
    REQUIRE(provider.last_provider() == "primary");
    REQUIRE(secondary_ptr->calls == 0);
}

TEST_CASE("FallbackMatrixProvider: falls back after exhausting retries", "[matrix]") {
    auto primary = std::make_unique<FlakyProvider>("primary", 5, 0.5);
    auto* primary_ptr = primary.get();

    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    chain.push_back(std::move(primary));
    chain.push_back(std::make_unique<FlakyProvider>("secondary", 0, 0.1));
    FallbackMatrixProvider provider(std::move(chain), 2);

    auto m = provider.compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(m.at(1, 1) == 0.1);
    REQUIRE(primary_ptr->calls == 2);
    REQUIRE(provider.last_provider() == "secondary");
}

TEST_CASE("FallbackMatrixProvider: retry recovers the first provider", "[matrix]") {
    auto primary = std::make_unique<FlakyProvider>("primary", 1, 0.5);
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    chain.push_back(std::move(primary));
    chain.push_back(std::make_unique<FlakyProvider>("secondary", 0, 0.1));
    FallbackMatrixProvider provider(std::move(chain), 2);

    provider.compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(provider.last_provider() == "primary");
}

TEST_CASE("FallbackMatrixProvider: all providers failing throws last error", "[matrix]") {
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    chain.push_back(std::make_unique<FlakyProvider>("primary", 9, 0.5));
    chain.push_back(std::make_unique<FlakyProvider>("secondary", 9, 0.1));
    FallbackMatrixProvider provider(std::move(chain));

    try {
        provider.compute(make_events({"a", "b"}), frames_1_to(2));
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("secondary unavailable") != std::string::npos);
    }
}

TEST_CASE("FallbackMatrixProvider: empty chain rejected", "[matrix]") {
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> chain;
    REQUIRE_THROWS_AS(FallbackMatrixProvider(std::move(chain)), std::invalid_argument);
}

// ── create_matrix_provider ──────────────────────────────────────

TEST_CASE("create_matrix_provider: batch first, pairwise when batch fails", "[matrix]") {
    FakeSimilarityClient client;
    client.set(1, "a", 0.6);
    SimilarityCache cache;
    PairSimilarity pairs(client, cache);
    ServiceConfig cfg;
    cfg.pairwise_group_delay_ms = 0;

    auto provider = create_matrix_provider(cfg, client, cache, pairs);
    auto* chain = dynamic_cast<FallbackMatrixProvider*>(provider.get());
    REQUIRE(chain != nullptr);

    provider->compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(chain->last_provider() == "batch");
    REQUIRE(client.frame_text_calls == 0);

    cache.clear();
    client.batch_fails = true;
    auto m = provider->compute(make_events({"a", "b"}), frames_1_to(2));
    REQUIRE(chain->last_provider() == "pairwise");
    REQUIRE(client.frame_text_calls == 4);
    REQUIRE(m.at(0, 0) == 0.6);
}
