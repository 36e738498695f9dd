#pragma once
#include "types.hpp"
#include "config.hpp"
#include "pivot.hpp"
#include "validator.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace eventseq {

class FrameSource;
class PairSimilarity;
class SimilarityCache;
class SimilarityMatrixProvider;

// A search that cannot produce any result: too few events, or the initial
// retrieval failed or came back empty.
class SearchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class CandidateStatus {
    Accepted,
    BelowPivotThreshold,
    Rejected,   // built but failed validation; see verdict
    Failed      // a service call for this candidate failed
};

inline const char* candidate_status_to_string(CandidateStatus status) {
    switch (status) {
        case CandidateStatus::Accepted: return "accepted";
        case CandidateStatus::BelowPivotThreshold: return "below_pivot_threshold";
        case CandidateStatus::Rejected: return "rejected";
        case CandidateStatus::Failed: return "failed";
    }
    return "failed";
}

// What happened to one candidate during sequence discovery.
struct CandidateOutcome {
    Frame candidate;
    PivotMatch pivot;
    size_t window_size = 0;
    Sequence slots;           // one per event, unassigned included
    Sequence sequence;        // assigned slots only
    CandidateStatus status = CandidateStatus::Failed;
    Verdict verdict = Verdict::Empty;
    std::string reason;
};

struct CandidateStats {
    size_t count = 0;
    double min_similarity = 0.0;
    double max_similarity = 0.0;
    double mean_similarity = 0.0;
};

struct ScoringRecord {
    ScoredSequence scored;
    bool passed_threshold = false;
};

// Phase-by-phase trace of one analysis run.
struct AnalysisReport {
    std::string started_at;
    AlgorithmConfig config;
    std::vector<Event> events;

    // Phase 1: initial retrieval
    std::string query;
    std::vector<Frame> candidates;
    CandidateStats candidate_stats;
    double retrieval_ms = 0.0;

    // Phase 2: sequence discovery
    std::vector<CandidateOutcome> outcomes;
    size_t valid_sequences = 0;
    double discovery_ms = 0.0;

    // Phase 3: scoring and ranking
    std::vector<ScoringRecord> scoring;   // best first, threshold failures included
    std::vector<ScoredSequence> results;
    double scoring_ms = 0.0;

    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
};

// One search context: a validated config snapshot plus the collaborators it
// talks to. Holds no per-search state, so search() may be called repeatedly.
class SearchSession {
public:
    SearchSession(AlgorithmConfig config, FrameSource& frames, PairSimilarity& pairs,
                  SimilarityMatrixProvider& matrix, SimilarityCache& cache);

    // Ranked sequences for the ordered events, possibly empty.
    // Throws SearchError on a fatal failure.
    std::vector<ScoredSequence> search(const std::vector<Event>& events);

    // Instrumented run over the first `candidate_limit` candidates.
    // Clears the similarity cache first. Throws SearchError like search().
    AnalysisReport analyze(const std::vector<Event>& events, size_t candidate_limit = 10);

    const AlgorithmConfig& config() const { return config_; }

    // Pivot selection, window expansion, matrix fetch, build and validation
    // for one candidate. Never throws; failures land in the outcome.
    CandidateOutcome process_candidate(const Frame& candidate, const std::vector<Event>& events);

private:
    void check_events(const std::vector<Event>& events) const;
    std::vector<Frame> retrieve_candidates(const std::string& query);

    AlgorithmConfig config_;
    FrameSource& frames_;
    PairSimilarity& pairs_;
    SimilarityMatrixProvider& matrix_;
    SimilarityCache& cache_;
};

CandidateStats summarize_candidates(const std::vector<Frame>& candidates);

} // namespace eventseq
