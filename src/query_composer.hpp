#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace eventseq {

// Merge ordered events into one retrieval query. A single event is returned
// as-is; several become "temporal sequence: first A, then B, ..., finally Z"
// with interior transitions cycling by index (i % 3) through
// "followed by", "then", "subsequently".
// Throws std::invalid_argument when events is empty.
std::string compose_temporal_query(const std::vector<Event>& events);

} // namespace eventseq
