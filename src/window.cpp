#include "window.hpp"
#include "frame_source.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace eventseq {

FrameWindow window_around(int64_t pivot_frame_number, int64_t radius) {
    constexpr int64_t lowest = std::numeric_limits<int64_t>::min();
    constexpr int64_t highest = std::numeric_limits<int64_t>::max();
    radius = std::max<int64_t>(0, radius);

    // Saturate instead of overflowing when the radius is huge.
    int64_t lower = pivot_frame_number < lowest + radius ? lowest : pivot_frame_number - radius;
    int64_t upper = pivot_frame_number > highest - radius ? highest : pivot_frame_number + radius;

    FrameWindow w;
    w.min_frame = std::max<int64_t>(1, lower);
    w.max_frame = upper;
    return w;
}

std::vector<Frame> frames_in_window(const std::vector<Frame>& frames,
                                    const std::string& video_id,
                                    const FrameWindow& window) {
    std::vector<Frame> out;
    for (const auto& f : frames) {
        if (f.video_id == video_id && window.contains(f.keyframe_n)) {
            out.push_back(f);
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const Frame& a, const Frame& b) {
        return a.keyframe_n < b.keyframe_n;
    });
    // Frame numbers are unique within a video; keep the first of any duplicate.
    out.erase(std::unique(out.begin(), out.end(), [](const Frame& a, const Frame& b) {
                  return a.keyframe_n == b.keyframe_n;
              }),
              out.end());
    return out;
}

std::vector<Frame> expand_window(FrameSource& source, const Frame& pivot, int64_t radius) {
    FrameWindow window = window_around(pivot.keyframe_n, radius);
    try {
        return frames_in_window(source.video_frames(pivot.video_id), pivot.video_id, window);
    } catch (const std::exception& e) {
        std::cerr << "[frames] Window fetch failed for video " << pivot.video_id
                  << " around frame " << pivot.keyframe_n << ": " << e.what() << "\n";
        return {};
    }
}

} // namespace eventseq
