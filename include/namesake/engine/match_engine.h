#pragma once

#include <namesake/config/engine_config.h>
#include <namesake/engine/match_types.h>
#include <namesake/model/schema_catalog.h>
#include <namesake/normalize/normalizer.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace namesake::engine {

/**
 * @brief Scores query entities against candidate entities
 *
 * Candidates of a request are scored in parallel on an engine-owned worker
 * pool. Scoring a candidate has no side effects, so the ranked output does not
 * depend on scheduling. A shared deadline stops new candidates from being
 * scored; candidates already in flight finish and are kept.
 *
 * A failure while scoring one candidate yields a zero-score errored result for
 * that candidate only.
 */
class MatchEngine {
public:
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * @brief Validate configuration and catalog, then build the engine
     *
     * @param config Engine settings
     * @param catalog Schema catalog holder; the built-in catalog when null
     * @param normalizer Replaces the configured normalizer variant when set
     * @param clock Time source for deadline checks; steady_clock when empty
     */
    static Result<std::unique_ptr<MatchEngine>>
    create(config::EngineConfig config, std::shared_ptr<model::CatalogHandle> catalog = nullptr,
           std::shared_ptr<const normalize::INormalizer> normalizer = nullptr, ClockFn clock = {});

    ~MatchEngine();

    MatchEngine(const MatchEngine&) = delete;
    MatchEngine& operator=(const MatchEngine&) = delete;

    /**
     * @brief Score one query against the given candidates
     *
     * @return Top `topK` results; status TimedOut when the deadline expired
     *         before every candidate was scored
     */
    Result<QueryResponse> match(const model::Entity& query,
                                std::span<const model::Entity> candidates,
                                scoring::AlgorithmId algorithm, size_t topK,
                                std::optional<Deadline> deadline = std::nullopt);

    /**
     * @brief Score several named queries under one shared deadline
     *
     * The deadline comes from params.timeout or the configured default. Each
     * query considers at most candidateLimit(limit, factor) candidates, after
     * excluded schemas and ids are removed.
     */
    Result<BatchResponse> matchBatch(const std::map<std::string, MatchRequest>& requests,
                                     const MatchParams& params = {});

    /**
     * @brief Enabled algorithms; fixed for the lifetime of the engine
     */
    std::vector<scoring::AlgorithmId> listAlgorithms() const;

    const config::EngineConfig& getConfig() const;

    std::shared_ptr<model::CatalogHandle> catalog() const;

    struct Statistics {
        std::atomic<uint64_t> totalQueries{0};
        std::atomic<uint64_t> completedQueries{0};
        std::atomic<uint64_t> timedOutQueries{0};
        std::atomic<uint64_t> failedRequests{0};

        std::atomic<uint64_t> scoredCandidates{0};
        std::atomic<uint64_t> erroredCandidates{0};
        std::atomic<uint64_t> schemaMismatches{0};

        std::atomic<uint64_t> totalQueryTimeMicros{0};
        std::atomic<uint64_t> avgQueryTimeMicros{0};
    };

    const Statistics& getStatistics() const;
    void resetStatistics();

private:
    class Impl;
    explicit MatchEngine(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl_;
};

} // namespace namesake::engine
