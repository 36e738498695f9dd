#include "validator.hpp"

namespace eventseq {

Verdict check_sequence(const Sequence& sequence, size_t event_count,
                       double min_completeness) {
    Sequence assigned = assigned_slots(sequence);
    if (assigned.empty() || event_count == 0) return Verdict::Empty;

    double completeness = static_cast<double>(assigned.size()) /
                          static_cast<double>(event_count);
    if (completeness < min_completeness) return Verdict::Incomplete;

    for (size_t i = 1; i < assigned.size(); ++i) {
        if (assigned[i].frame_number <= assigned[i - 1].frame_number) {
            return Verdict::OutOfOrder;
        }
    }
    return Verdict::Valid;
}

} // namespace eventseq
