#include <catch2/catch_test_macros.hpp>
#include "window.hpp"
#include "fakes.hpp"
#include <limits>

using namespace eventseq;

// ── window_around ────────────────────────────────────────────────

TEST_CASE("window_around: symmetric radius", "[window]") {
    auto w = window_around(5000, 3000);
    REQUIRE(w.min_frame == 2000);
    REQUIRE(w.max_frame == 8000);
}

TEST_CASE("window_around: lower bound clamps to 1", "[window]") {
    auto w = window_around(500, 3000);
    REQUIRE(w.min_frame == 1);
    REQUIRE(w.max_frame == 3500);
    REQUIRE(w.contains(1));
    REQUIRE_FALSE(w.contains(0));
    REQUIRE(w.contains(3500));
    REQUIRE_FALSE(w.contains(3501));
}

TEST_CASE("window_around: huge radius saturates instead of wrapping", "[window]") {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    auto w = window_around(500, max);
    REQUIRE(w.min_frame == 1);
    REQUIRE(w.max_frame == max);
    REQUIRE(w.contains(620));
    REQUIRE(w.contains(1));

    auto near_top = window_around(max - 10, 100);
    REQUIRE(near_top.max_frame == max);
    REQUIRE(near_top.min_frame == max - 110);
}

TEST_CASE("window_around: negative radius keeps only the pivot", "[window]") {
    auto w = window_around(500, -20);
    REQUIRE(w.min_frame == 500);
    REQUIRE(w.max_frame == 500);
}

TEST_CASE("expand_window: huge radius keeps the whole video", "[window]") {
    FakeFrameSource source;
    source.videos["v1"] = {
        make_frame(1, "v1", 10), make_frame(2, "v1", 500), make_frame(3, "v1", 90000),
    };
    auto frames = expand_window(source, make_frame(2, "v1", 500),
                                std::numeric_limits<int64_t>::max());
    REQUIRE(frames.size() == 3);
}

// ── frames_in_window ─────────────────────────────────────────────

TEST_CASE("frames_in_window: filters by video and range, sorted", "[window]") {
    std::vector<Frame> frames = {
        make_frame(1, "v1", 900),
        make_frame(2, "v1", 100),
        make_frame(3, "v2", 500),
        make_frame(4, "v1", 1200),
        make_frame(5, "v1", 400),
    };
    auto out = frames_in_window(frames, "v1", window_around(500, 500));
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].keyframe_n == 100);
    REQUIRE(out[1].keyframe_n == 400);
    REQUIRE(out[2].keyframe_n == 900);
}

TEST_CASE("frames_in_window: duplicate frame numbers collapse to the first", "[window]") {
    std::vector<Frame> frames = {
        make_frame(1, "v1", 300),
        make_frame(2, "v1", 300),
    };
    auto out = frames_in_window(frames, "v1", window_around(300, 10));
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].id == 1);
}

// ── expand_window ────────────────────────────────────────────────

TEST_CASE("expand_window: applying twice yields the same frames", "[window]") {
    FakeFrameSource source;
    source.videos["v1"] = {
        make_frame(1, "v1", 10), make_frame(2, "v1", 500),
        make_frame(3, "v1", 700), make_frame(4, "v1", 9000),
    };
    Frame pivot = make_frame(2, "v1", 500);

    auto first = expand_window(source, pivot, 3000);
    auto second = expand_window(source, pivot, 3000);
    REQUIRE(first.size() == 3);
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].id == second[i].id);
    }
}

TEST_CASE("expand_window: fetch failure yields an empty window", "[window]") {
    FakeFrameSource source;
    source.failing_videos.insert("v1");
    auto frames = expand_window(source, make_frame(1, "v1", 500), 3000);
    REQUIRE(frames.empty());
    REQUIRE(source.frames_calls == 1);
}

TEST_CASE("expand_window: unknown video yields an empty window", "[window]") {
    FakeFrameSource source;
    REQUIRE(expand_window(source, make_frame(1, "missing", 500), 3000).empty());
}
