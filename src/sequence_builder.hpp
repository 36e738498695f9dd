#pragma once
#include "types.hpp"
#include "similarity/similarity_matrix.hpp"
#include <vector>

namespace eventseq {

// Place the pivot, then fill earlier events walking backwards and later
// events walking forwards. For each event the eligible window frames
// (strictly before / after the pivot) are tried in descending similarity;
// the first one that stays strictly ordered against the nearest placed
// neighbour towards the pivot is taken. Events with no such frame, or whose
// best ordered frame scores below similarity_threshold, stay unassigned.
//
// `window` must be the frame list `matrix` was computed for (column j
// scores window[j]). The pivot slot keeps the pivot frame's own similarity.
// Returns one slot per event, in event order.
Sequence assemble_slots(const Frame& pivot, uint32_t pivot_event,
                        const std::vector<Event>& events,
                        const std::vector<Frame>& window,
                        const SimilarityMatrix& matrix,
                        double similarity_threshold);

// assemble_slots() reduced to the assigned slots.
Sequence build_sequence(const Frame& pivot, uint32_t pivot_event,
                        const std::vector<Event>& events,
                        const std::vector<Frame>& window,
                        const SimilarityMatrix& matrix,
                        double similarity_threshold);

} // namespace eventseq
