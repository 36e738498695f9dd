#include "report.hpp"
#include "frame_source.hpp"
#include "util.hpp"

namespace eventseq {

namespace {

std::string percent(double score) {
    return format_fixed(score * 100.0, 1) + "%";
}

const std::string& describe_event(const std::vector<Event>& events, uint32_t index) {
    static const std::string unknown = "?";
    return index < events.size() ? events[index].description : unknown;
}

nlohmann::json slots_to_json(const Sequence& slots) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : slots) arr.push_back(to_json(s));
    return arr;
}

} // namespace

nlohmann::json to_json(const Event& event) {
    return {
        {"index", event.index},
        {"description", event.description},
        {"weight", event.weight}
    };
}

nlohmann::json to_json(const SequenceSlot& slot) {
    nlohmann::json j = {
        {"event_index", slot.event_index},
        {"assigned", slot.assigned()}
    };
    if (!slot.assigned()) return j;

    j["frame"] = to_json(slot.frame);
    j["similarity"] = slot.similarity;
    j["frame_number"] = slot.frame_number;
    j["video_id"] = slot.video_id;
    j["is_pivot"] = slot.is_pivot;
    return j;
}

nlohmann::json to_json(const ScoreBreakdown& breakdown) {
    return {
        {"base_similarity", breakdown.base_similarity},
        {"temporal", breakdown.temporal},
        {"completeness", breakdown.completeness},
        {"consistency", breakdown.consistency},
        {"order", breakdown.order}
    };
}

nlohmann::json to_json(const ScoredSequence& sequence) {
    const auto& m = sequence.metadata;
    return {
        {"score", sequence.score},
        {"breakdown", to_json(sequence.breakdown)},
        {"metadata", {
            {"video_id", m.video_id},
            {"start_frame", m.start_frame},
            {"end_frame", m.end_frame},
            {"duration", m.duration},
            {"completeness", m.completeness}
        }},
        {"sequence", slots_to_json(sequence.slots)}
    };
}

nlohmann::json to_json(const CandidateOutcome& outcome) {
    nlohmann::json j = {
        {"candidate", to_json(outcome.candidate)},
        {"status", candidate_status_to_string(outcome.status)},
        {"reason", outcome.reason}
    };
    if (outcome.status == CandidateStatus::Failed) return j;

    j["pivot_event"] = outcome.pivot.event_index;
    j["pivot_similarity"] = outcome.pivot.similarity;
    if (outcome.status == CandidateStatus::BelowPivotThreshold) return j;

    j["window_size"] = outcome.window_size;
    j["verdict"] = verdict_to_string(outcome.verdict);
    j["slots"] = slots_to_json(outcome.slots);
    return j;
}

nlohmann::json to_json(const AnalysisReport& report) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& e : report.events) events.push_back(to_json(e));

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& o : report.outcomes) outcomes.push_back(to_json(o));

    nlohmann::json scoring = nlohmann::json::array();
    for (const auto& r : report.scoring) {
        nlohmann::json entry = to_json(r.scored);
        entry["passed_threshold"] = r.passed_threshold;
        scoring.push_back(std::move(entry));
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : report.results) results.push_back(to_json(r));

    const auto& stats = report.candidate_stats;
    return {
        {"started_at", report.started_at},
        {"config", to_json(report.config)},
        {"events", events},
        {"retrieval", {
            {"query", report.query},
            {"candidates", stats.count},
            {"similarity", {
                {"min", stats.min_similarity},
                {"max", stats.max_similarity},
                {"mean", stats.mean_similarity}
            }},
            {"elapsed_ms", report.retrieval_ms}
        }},
        {"discovery", {
            {"processed", report.outcomes.size()},
            {"valid_sequences", report.valid_sequences},
            {"candidates", outcomes},
            {"elapsed_ms", report.discovery_ms}
        }},
        {"scoring", {
            {"scored", scoring},
            {"passed", report.results.size()},
            {"elapsed_ms", report.scoring_ms}
        }},
        {"cache", {
            {"hits", report.cache_hits},
            {"misses", report.cache_misses}
        }},
        {"results", results}
    };
}

nlohmann::json results_to_json(const std::vector<Event>& events,
                               const std::vector<ScoredSequence>& results) {
    nlohmann::json ev = nlohmann::json::array();
    for (const auto& e : events) ev.push_back(to_json(e));

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) arr.push_back(to_json(r));

    return {
        {"events", ev},
        {"count", results.size()},
        {"results", arr}
    };
}

void render_results(std::ostream& out, const std::vector<Event>& events,
                    const std::vector<ScoredSequence>& results) {
    if (results.empty()) {
        out << "No sequences found.\n";
        return;
    }

    out << results.size() << (results.size() == 1 ? " sequence" : " sequences") << " found\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        const auto& m = r.metadata;
        out << "\n#" << (i + 1) << "  score " << percent(r.score)
            << "  video " << m.video_id
            << "  frames " << m.start_frame << "-" << m.end_frame
            << "  (" << r.slots.size() << "/" << events.size() << " events)\n";

        for (const auto& s : r.slots) {
            out << "  " << (s.is_pivot ? "*" : " ")
                << " [" << (s.event_index + 1) << "] "
                << describe_event(events, s.event_index)
                << "  -> frame " << s.frame_number
                << "  " << percent(s.similarity) << "\n";
        }

        const auto& b = r.breakdown;
        out << "    similarity " << format_fixed(b.base_similarity, 3)
            << "  temporal " << format_fixed(b.temporal, 3)
            << "  completeness " << format_fixed(b.completeness, 3)
            << "  consistency " << format_fixed(b.consistency, 3)
            << "  order " << format_fixed(b.order, 3) << "\n";
    }
}

void render_analysis(std::ostream& out, const AnalysisReport& report) {
    const auto& stats = report.candidate_stats;
    out << "Analysis started " << report.started_at << "\n"
        << "Query: " << report.query << "\n\n";

    out << "Phase 1: initial retrieval (" << format_fixed(report.retrieval_ms, 1) << " ms)\n"
        << "  " << stats.count << " candidates, similarity "
        << format_fixed(stats.min_similarity, 3) << " - "
        << format_fixed(stats.max_similarity, 3)
        << " (mean " << format_fixed(stats.mean_similarity, 3) << ")\n\n";

    out << "Phase 2: sequence discovery (" << format_fixed(report.discovery_ms, 1) << " ms)\n";
    for (size_t i = 0; i < report.outcomes.size(); ++i) {
        const auto& o = report.outcomes[i];
        out << "  " << (i + 1) << ". frame " << o.candidate.keyframe_n
            << " (video " << o.candidate.video_id << "): "
            << candidate_status_to_string(o.status);
        if (o.status != CandidateStatus::Failed) {
            out << ", pivot event " << (o.pivot.event_index + 1)
                << " at " << format_fixed(o.pivot.similarity, 3);
        }
        out << ", " << o.reason << "\n";
    }
    out << "  " << report.valid_sequences << " valid sequences\n\n";

    out << "Phase 3: scoring (" << format_fixed(report.scoring_ms, 1) << " ms)\n";
    for (const auto& r : report.scoring) {
        out << "  " << percent(r.scored.score) << "  video " << r.scored.metadata.video_id
            << "  " << (r.passed_threshold ? "passed" : "below threshold") << "\n";
    }
    out << "  cache: " << report.cache_hits << " hits, " << report.cache_misses << " misses\n\n";

    render_results(out, report.events, report.results);
}

} // namespace eventseq
