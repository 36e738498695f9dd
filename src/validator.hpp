#pragma once
#include "types.hpp"
#include <cstddef>

namespace eventseq {

enum class Verdict { Valid, Empty, Incomplete, OutOfOrder };

inline const char* verdict_to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::Valid: return "valid";
        case Verdict::Empty: return "empty";
        case Verdict::Incomplete: return "incomplete";
        case Verdict::OutOfOrder: return "out_of_order";
    }
    return "valid";
}

// Check a finalized sequence (assigned slots only, event order):
// non-empty, assigned/event_count >= min_completeness, and strictly
// increasing frame numbers between consecutive slots.
Verdict check_sequence(const Sequence& sequence, size_t event_count,
                       double min_completeness);

inline bool is_sequence_valid(const Sequence& sequence, size_t event_count,
                              double min_completeness) {
    return check_sequence(sequence, event_count, min_completeness) == Verdict::Valid;
}

} // namespace eventseq
