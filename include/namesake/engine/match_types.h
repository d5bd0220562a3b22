#pragma once

#include <namesake/core/types.h>
#include <namesake/model/entity.h>
#include <namesake/scoring/algorithm.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace namesake::engine {

enum class QueryStatus { Complete, TimedOut };

constexpr const char* queryStatusToString(QueryStatus status) {
    switch (status) {
        case QueryStatus::Complete:
            return "complete";
        case QueryStatus::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

/**
 * @brief Lifecycle of one match request
 *
 * Pending -> Scoring -> Ranking -> Complete, or TimedOut when the deadline
 * expires before every candidate was scored.
 */
enum class RequestState { Pending, Scoring, Ranking, Complete, TimedOut };

constexpr const char* requestStateToString(RequestState state) {
    switch (state) {
        case RequestState::Pending:
            return "pending";
        case RequestState::Scoring:
            return "scoring";
        case RequestState::Ranking:
            return "ranking";
        case RequestState::Complete:
            return "complete";
        case RequestState::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

// Diagnostic tags attached to zero-score results
inline constexpr const char* kSchemaMismatch = "schema_mismatch";
inline constexpr const char* kNoEvidence = "no_evidence";
inline constexpr const char* kScoringError = "scoring_error";

struct MatchResult {
    EntityId queryId;
    EntityId candidateId;
    std::string schema;
    double score = 0.0;
    bool match = false;
    scoring::AlgorithmId algorithm = scoring::AlgorithmId::LogicV1;
    std::vector<scoring::FeatureContribution> features;

    // Scoring threw; the result carries score 0 and the reason
    bool errored = false;
    std::string diagnostic;
};

/**
 * @brief Results ordered by score descending, then candidate id ascending
 */
struct RankedResultSet {
    std::vector<MatchResult> results;
    size_t totalCandidates = 0;
    size_t scoredCandidates = 0;
    size_t erroredCandidates = 0;

    [[nodiscard]] bool empty() const { return results.empty(); }
    [[nodiscard]] size_t size() const { return results.size(); }
};

struct QueryResponse {
    std::string name;
    QueryStatus status = QueryStatus::Complete;
    scoring::AlgorithmId algorithm = scoring::AlgorithmId::LogicV1;
    std::string catalogVersion;
    RankedResultSet ranked;
    int64_t executionTimeMs = 0;

    [[nodiscard]] bool isComplete() const { return status == QueryStatus::Complete; }
};

/**
 * @brief Per-request overrides of the engine defaults
 */
struct MatchParams {
    std::optional<scoring::AlgorithmId> algorithm;
    std::optional<size_t> limit;
    std::optional<double> threshold;
    std::optional<double> cutoff;
    std::optional<size_t> candidateFactor;
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> excludeSchemas;
    std::vector<EntityId> excludeIds;
};

/**
 * @brief One named query of a batch with the candidates to score it against
 */
struct MatchRequest {
    model::Entity query;
    std::vector<model::Entity> candidates;
};

struct BatchResponse {
    std::map<std::string, QueryResponse> responses;
    RequestState state = RequestState::Pending;
    std::vector<std::string> timedOutQueries;
    int64_t executionTimeMs = 0;

    [[nodiscard]] bool isComplete() const { return state == RequestState::Complete; }
};

} // namespace namesake::engine
