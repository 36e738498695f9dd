#pragma once
#include "types.hpp"
#include "search.hpp"
#include <ostream>
#include <vector>
#include <nlohmann/json.hpp>

namespace eventseq {

nlohmann::json to_json(const Event& event);
nlohmann::json to_json(const SequenceSlot& slot);
nlohmann::json to_json(const ScoreBreakdown& breakdown);
nlohmann::json to_json(const ScoredSequence& sequence);
nlohmann::json to_json(const CandidateOutcome& outcome);
nlohmann::json to_json(const AnalysisReport& report);

// {"events": [...], "count": n, "results": [...]}
nlohmann::json results_to_json(const std::vector<Event>& events,
                               const std::vector<ScoredSequence>& results);

// Human-readable ranking: one block per sequence with its per-event frames.
void render_results(std::ostream& out, const std::vector<Event>& events,
                    const std::vector<ScoredSequence>& results);

// Phase summary of an analysis run, followed by the ranked results.
void render_analysis(std::ostream& out, const AnalysisReport& report);

} // namespace eventseq
