#include "sequence_builder.hpp"
#include <algorithm>
#include <stdexcept>

namespace eventseq {

namespace {

enum class Direction { Backward, Forward };

struct RankedFrame {
    size_t column;
    double similarity;
};

// Window columns on the requested side of the pivot, best score first.
// Equal scores keep window order (ascending frame number).
std::vector<RankedFrame> rank_candidates(const std::vector<Frame>& window,
                                         const SimilarityMatrix& matrix,
                                         uint32_t event, int64_t pivot_frame,
                                         Direction dir) {
    std::vector<RankedFrame> ranked;
    if (event >= matrix.rows()) return ranked;

    size_t cols = std::min(window.size(), matrix.cols());
    for (size_t c = 0; c < cols; ++c) {
        int64_t n = window[c].keyframe_n;
        bool eligible = dir == Direction::Backward ? n < pivot_frame : n > pivot_frame;
        if (eligible) ranked.push_back({c, matrix.at(event, c)});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedFrame& a, const RankedFrame& b) {
                         return a.similarity > b.similarity;
                     });
    return ranked;
}

// Frame number of the closest assigned slot between `event` and the pivot.
// The pivot is always assigned, so one always exists.
int64_t anchor_frame(const Sequence& slots, uint32_t event, Direction dir) {
    if (dir == Direction::Backward) {
        for (size_t i = event + 1; i < slots.size(); ++i) {
            if (slots[i].assigned()) return slots[i].frame_number;
        }
    } else {
        for (size_t i = event; i-- > 0;) {
            if (slots[i].assigned()) return slots[i].frame_number;
        }
    }
    throw std::logic_error("sequence has no placed anchor");
}

void fill_event(Sequence& slots, uint32_t event, int64_t pivot_frame, Direction dir,
                const std::vector<Frame>& window, const SimilarityMatrix& matrix,
                double threshold) {
    int64_t anchor = anchor_frame(slots, event, dir);

    for (const auto& cand : rank_candidates(window, matrix, event, pivot_frame, dir)) {
        // Sorted descending: nothing further down can clear the threshold.
        if (cand.similarity < threshold) return;

        int64_t n = window[cand.column].keyframe_n;
        bool ordered = dir == Direction::Backward ? n < anchor : n > anchor;
        if (ordered) {
            slots[event] = SequenceSlot::assign(event, window[cand.column],
                                                cand.similarity, false);
            return;
        }
    }
}

} // namespace

Sequence assemble_slots(const Frame& pivot, uint32_t pivot_event,
                        const std::vector<Event>& events,
                        const std::vector<Frame>& window,
                        const SimilarityMatrix& matrix,
                        double similarity_threshold) {
    if (pivot_event >= events.size()) {
        throw std::invalid_argument("pivot event index out of range");
    }

    Sequence slots;
    slots.reserve(events.size());
    for (size_t i = 0; i < events.size(); ++i) {
        slots.push_back(SequenceSlot::unassigned(static_cast<uint32_t>(i)));
    }
    slots[pivot_event] = SequenceSlot::assign(pivot_event, pivot, pivot.similarity, true);

    if (window.empty()) return slots;

    // The two passes touch disjoint slots and share only the pivot.
    for (uint32_t e = pivot_event; e-- > 0;) {
        fill_event(slots, e, pivot.keyframe_n, Direction::Backward,
                   window, matrix, similarity_threshold);
    }
    for (uint32_t e = pivot_event + 1; e < events.size(); ++e) {
        fill_event(slots, e, pivot.keyframe_n, Direction::Forward,
                   window, matrix, similarity_threshold);
    }

    return slots;
}

Sequence build_sequence(const Frame& pivot, uint32_t pivot_event,
                        const std::vector<Event>& events,
                        const std::vector<Frame>& window,
                        const SimilarityMatrix& matrix,
                        double similarity_threshold) {
    return assigned_slots(assemble_slots(pivot, pivot_event, events, window,
                                         matrix, similarity_threshold));
}

} // namespace eventseq
