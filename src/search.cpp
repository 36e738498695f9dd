#include "search.hpp"
#include "frame_source.hpp"
#include "query_composer.hpp"
#include "ranker.hpp"
#include "scorer.hpp"
#include "sequence_builder.hpp"
#include "util.hpp"
#include "window.hpp"
#include "similarity/matrix_provider.hpp"
#include "similarity/pair_similarity.hpp"
#include "similarity/similarity_cache.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace eventseq {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

} // namespace

SearchSession::SearchSession(AlgorithmConfig config, FrameSource& frames, PairSimilarity& pairs,
                             SimilarityMatrixProvider& matrix, SimilarityCache& cache)
    : config_(std::move(config)), frames_(frames), pairs_(pairs), matrix_(matrix), cache_(cache) {
    config_.validate();
}

void SearchSession::check_events(const std::vector<Event>& events) const {
    if (events.size() < 2) {
        throw SearchError("at least 2 events are required, got " + std::to_string(events.size()));
    }
    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].index != i) {
            throw SearchError("event " + std::to_string(i) + " has index " +
                              std::to_string(events[i].index));
        }
    }
}

std::vector<Frame> SearchSession::retrieve_candidates(const std::string& query) {
    std::vector<Frame> candidates;
    try {
        candidates = frames_.search_text(query, config_.top_k);
    } catch (const std::exception& e) {
        throw SearchError(std::string("initial retrieval failed: ") + e.what());
    }
    if (candidates.empty()) {
        throw SearchError("initial retrieval returned no candidates");
    }
    return candidates;
}

CandidateOutcome SearchSession::process_candidate(const Frame& candidate,
                                                  const std::vector<Event>& events) {
    CandidateOutcome out;
    out.candidate = candidate;
    out.pivot.frame = candidate;

    try {
        out.pivot = select_pivot(candidate, events, pairs_);
        if (out.pivot.similarity < config_.similarity_threshold) {
            out.status = CandidateStatus::BelowPivotThreshold;
            out.reason = "pivot similarity " + format_fixed(out.pivot.similarity, 3) +
                         " below threshold " + format_fixed(config_.similarity_threshold, 3);
            return out;
        }

        std::vector<Frame> window = expand_window(frames_, candidate, config_.search_window);
        out.window_size = window.size();

        SimilarityMatrix matrix;
        if (window.empty()) {
            std::cerr << "[search] No frames in window for candidate " << candidate.id
                      << "; keeping pivot only\n";
        } else {
            matrix = matrix_.compute(events, window);
        }

        out.slots = assemble_slots(candidate, out.pivot.event_index, events, window,
                                   matrix, config_.similarity_threshold);
        out.sequence = assigned_slots(out.slots);
        out.verdict = check_sequence(out.sequence, events.size(),
                                     config_.min_sequence_completeness);
        if (out.verdict == Verdict::Valid) {
            out.status = CandidateStatus::Accepted;
            out.reason = "matched " + std::to_string(out.sequence.size()) + "/" +
                         std::to_string(events.size()) + " events";
        } else {
            out.status = CandidateStatus::Rejected;
            out.reason = std::string("sequence ") + verdict_to_string(out.verdict);
            if (window.empty()) out.reason += " (no frames in window)";
        }
    } catch (const std::exception& e) {
        out.status = CandidateStatus::Failed;
        out.reason = e.what();
        std::cerr << "[search] Skipping candidate " << candidate.id << " (video "
                  << candidate.video_id << ", frame " << candidate.keyframe_n
                  << "): " << e.what() << "\n";
    }
    return out;
}

std::vector<ScoredSequence> SearchSession::search(const std::vector<Event>& events) {
    check_events(events);

    std::string query = compose_temporal_query(events);
    std::vector<Frame> candidates = retrieve_candidates(query);
    std::cerr << "[search] " << candidates.size() << " candidates for \"" << query << "\"\n";

    std::vector<ScoredSequence> scored;
    for (const auto& candidate : candidates) {
        CandidateOutcome outcome = process_candidate(candidate, events);
        if (outcome.status != CandidateStatus::Accepted) continue;
        scored.push_back(score_sequence(outcome.sequence, events.size(), config_));
    }

    auto ranked = rank_sequences(std::move(scored), config_.score_threshold);
    std::cerr << "[search] " << ranked.size() << " sequences passed the score threshold\n";
    return ranked;
}

AnalysisReport SearchSession::analyze(const std::vector<Event>& events, size_t candidate_limit) {
    check_events(events);
    cache_.clear();

    AnalysisReport report;
    report.started_at = timestamp_now();
    report.config = config_;
    report.events = events;

    auto t0 = std::chrono::steady_clock::now();
    report.query = compose_temporal_query(events);
    report.candidates = retrieve_candidates(report.query);
    report.candidate_stats = summarize_candidates(report.candidates);
    report.retrieval_ms = elapsed_ms(t0);

    auto t1 = std::chrono::steady_clock::now();
    size_t limit = std::min(candidate_limit, report.candidates.size());
    std::vector<Sequence> valid;
    for (size_t i = 0; i < limit; ++i) {
        const Frame& candidate = report.candidates[i];
        std::cerr << "[search] Candidate " << (i + 1) << "/" << limit << " (frame "
                  << candidate.keyframe_n << ", video " << candidate.video_id << ")\n";
        CandidateOutcome outcome = process_candidate(candidate, events);
        if (outcome.status == CandidateStatus::Accepted) valid.push_back(outcome.sequence);
        report.outcomes.push_back(std::move(outcome));
    }
    report.valid_sequences = valid.size();
    report.discovery_ms = elapsed_ms(t1);

    auto t2 = std::chrono::steady_clock::now();
    std::vector<ScoredSequence> scored;
    for (const auto& seq : valid) {
        ScoringRecord record;
        record.scored = score_sequence(seq, events.size(), config_);
        record.passed_threshold = record.scored.score >= config_.score_threshold;
        scored.push_back(record.scored);
        report.scoring.push_back(std::move(record));
    }
    std::stable_sort(report.scoring.begin(), report.scoring.end(),
                     [](const ScoringRecord& a, const ScoringRecord& b) {
                         return a.scored.score > b.scored.score;
                     });
    report.results = rank_sequences(std::move(scored), config_.score_threshold);
    report.scoring_ms = elapsed_ms(t2);

    CacheStats stats = cache_.stats();
    report.cache_hits = stats.hits;
    report.cache_misses = stats.misses;
    return report;
}

CandidateStats summarize_candidates(const std::vector<Frame>& candidates) {
    CandidateStats stats;
    stats.count = candidates.size();
    if (candidates.empty()) return stats;

    stats.min_similarity = candidates.front().similarity;
    stats.max_similarity = candidates.front().similarity;
    double sum = 0.0;
    for (const auto& c : candidates) {
        stats.min_similarity = std::min(stats.min_similarity, c.similarity);
        stats.max_similarity = std::max(stats.max_similarity, c.similarity);
        sum += c.similarity;
    }
    stats.mean_similarity = sum / static_cast<double>(candidates.size());
    return stats;
}

} // namespace eventseq
