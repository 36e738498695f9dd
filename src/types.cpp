#include "types.hpp"
#include "util.hpp"

namespace eventseq {

std::vector<Event> make_events(const std::vector<std::string>& descriptions) {
    std::vector<Event> events;
    events.reserve(descriptions.size());
    for (const auto& d : descriptions) {
        std::string text = trim(d);
        if (text.empty()) continue;
        Event ev;
        ev.index = static_cast<uint32_t>(events.size());
        ev.description = std::move(text);
        events.push_back(std::move(ev));
    }
    return events;
}

Sequence assigned_slots(const Sequence& slots) {
    Sequence out;
    out.reserve(slots.size());
    for (const auto& slot : slots) {
        if (slot.assigned()) out.push_back(slot);
    }
    return out;
}

} // namespace eventseq
