#pragma once
#include "types.hpp"
#include <cstdint>
#include <vector>

namespace eventseq {

class FrameSource;

// Inclusive frame-number range around a pivot.
struct FrameWindow {
    int64_t min_frame = 1;
    int64_t max_frame = 0;

    bool contains(int64_t frame_number) const {
        return frame_number >= min_frame && frame_number <= max_frame;
    }
};

// [max(1, pivot - radius), pivot + radius], saturating at the int64 range.
// A negative radius is treated as zero.
FrameWindow window_around(int64_t pivot_frame_number, int64_t radius);

// Frames of `video_id` inside the window, ordered by frame number, one per
// frame number. Pure: the same input always yields the same list.
std::vector<Frame> frames_in_window(const std::vector<Frame>& frames,
                                    const std::string& video_id,
                                    const FrameWindow& window);

// Fetch the pivot's video and keep the frames inside its window.
// A failed fetch is logged and yields an empty window.
std::vector<Frame> expand_window(FrameSource& source, const Frame& pivot, int64_t radius);

} // namespace eventseq
