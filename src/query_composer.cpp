#include "query_composer.hpp"
#include <array>
#include <stdexcept>

namespace eventseq {

std::string compose_temporal_query(const std::vector<Event>& events) {
    if (events.empty()) {
        throw std::invalid_argument("cannot compose a query from zero events");
    }
    if (events.size() == 1) return events[0].description;

    static const std::array<const char*, 3> transitions = {"followed by", "then", "subsequently"};

    std::string query = "temporal sequence: ";
    for (size_t i = 0; i < events.size(); ++i) {
        const char* prefix;
        if (i == 0) {
            prefix = "first";
        } else if (i == events.size() - 1) {
            prefix = "finally";
        } else {
            prefix = transitions[i % transitions.size()];
        }

        query += prefix;
        query += ' ';
        query += events[i].description;
        if (i < events.size() - 1) query += ", ";
    }
    return query;
}

} // namespace eventseq
