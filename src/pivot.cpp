#include "pivot.hpp"
#include "similarity/pair_similarity.hpp"
#include <stdexcept>

namespace eventseq {

PivotMatch select_pivot(const Frame& candidate, const std::vector<Event>& events,
                        PairSimilarity& similarity) {
    if (events.empty()) {
        throw std::invalid_argument("pivot selection needs at least one event");
    }

    PivotMatch best;
    best.frame = candidate;
    best.event_index = 0;
    best.similarity = similarity.lookup(candidate, events[0].description);

    for (size_t i = 1; i < events.size(); ++i) {
        double s = similarity.lookup(candidate, events[i].description);
        if (s > best.similarity) {
            best.similarity = s;
            best.event_index = static_cast<uint32_t>(i);
        }
    }
    return best;
}

} // namespace eventseq
