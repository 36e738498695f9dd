#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace eventseq {

// One ordered stage of a temporal query.
struct Event {
    uint32_t index = 0;
    std::string description;
    double weight = 1.0; // fixed; reserved for weighted queries
};

// A keyframe as returned by the retrieval service. Read-only reference data.
struct Frame {
    int64_t id = 0;
    std::string video_id;
    int64_t keyframe_n = 0;   // stable per-video frame number, increases with playback
    double pts_time = 0.0;    // seconds
    double similarity = 0.0;  // score attached by the call that produced this frame
    std::string image_path;
    std::string image_filename;
};

enum class SlotState { Unassigned, Assigned };

// One event's place in a sequence. All fields are always present;
// an unmatched event is represented by state == Unassigned.
struct SequenceSlot {
    uint32_t event_index = 0;
    SlotState state = SlotState::Unassigned;
    Frame frame;
    double similarity = 0.0;
    int64_t frame_number = 0;
    std::string video_id;
    bool is_pivot = false;

    bool assigned() const { return state == SlotState::Assigned; }

    static SequenceSlot unassigned(uint32_t event_index) {
        SequenceSlot slot;
        slot.event_index = event_index;
        return slot;
    }

    static SequenceSlot assign(uint32_t event_index, const Frame& frame,
                               double similarity, bool is_pivot) {
        SequenceSlot slot;
        slot.event_index = event_index;
        slot.state = SlotState::Assigned;
        slot.frame = frame;
        slot.similarity = similarity;
        slot.frame_number = frame.keyframe_n;
        slot.video_id = frame.video_id;
        slot.is_pivot = is_pivot;
        return slot;
    }
};

// Slots in event-index order. A finalized sequence holds assigned slots only.
using Sequence = std::vector<SequenceSlot>;

struct ScoreBreakdown {
    double base_similarity = 0.0;
    double temporal = 0.0;
    double completeness = 0.0;
    double consistency = 0.0;
    double order = 0.0;
};

struct SequenceMetadata {
    std::string video_id;
    int64_t start_frame = 0;
    int64_t end_frame = 0;
    int64_t duration = 0; // in frame numbers
    double completeness = 0.0;
};

struct ScoredSequence {
    Sequence slots;
    double score = 0.0;
    ScoreBreakdown breakdown;
    SequenceMetadata metadata;
};

// Build an indexed event list from descriptions. Blank descriptions are
// dropped; surrounding whitespace is removed.
std::vector<Event> make_events(const std::vector<std::string>& descriptions);

// Keep assigned slots only, preserving event-index order.
Sequence assigned_slots(const Sequence& slots);

} // namespace eventseq
