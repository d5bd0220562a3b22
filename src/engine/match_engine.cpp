#include <namesake/engine/match_engine.h>
#include <namesake/features/feature_set_builder.h>
#include <namesake/normalize/normalizer.h>
#include <namesake/version.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace namesake::engine {

namespace {

struct QueryJob {
    std::string name;
    model::Entity query;
    std::vector<model::Entity> owned;
    std::span<const model::Entity> candidates;
    scoring::ScoringAlgorithm algorithm;
    size_t topK = 0;
    double threshold = 0.0;
    double cutoff = 0.0;
    std::vector<std::optional<MatchResult>> slots;
};

bool ranksBefore(const MatchResult& a, const MatchResult& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.candidateId < b.candidateId;
}

// Every property a feature names explicitly must carry the feature's type on
// each schema that defines it
Result<void> checkFeatureTypes(const model::SchemaCatalog& catalog,
                               const config::EngineConfig& config) {
    const auto schemas = catalog.schemaNames();
    for (auto id : config.enabledAlgorithms) {
        for (const auto& def : scoring::declaredFeatures(scoring::makeAlgorithm(id))) {
            std::vector<std::string> names = def.properties;
            names.insert(names.end(), def.candidateProperties.begin(),
                         def.candidateProperties.end());
            for (const auto& name : names) {
                for (const auto& schema : schemas) {
                    const auto* prop = catalog.property(schema, name);
                    if (prop && prop->type != def.type) {
                        return Error{ErrorCode::UnsupportedProperty,
                                     fmt::format("{}.{} is a {} property but feature {} of {} "
                                                 "compares {} values",
                                                 schema, name,
                                                 model::propertyTypeToString(prop->type),
                                                 def.name, scoring::algorithmName(id),
                                                 model::propertyTypeToString(def.type))};
                    }
                }
            }
        }
    }
    return {};
}

Result<void> checkFraction(const char* what, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        return Error{ErrorCode::InvalidArgument, fmt::format("{} must lie in [0,1]", what)};
    }
    return {};
}

} // namespace

class MatchEngine::Impl {
public:
    Impl(config::EngineConfig config, std::shared_ptr<model::CatalogHandle> catalog,
         std::shared_ptr<const features::FeatureSetBuilder> builder, ClockFn clock)
        : config_(std::move(config)),
          catalog_(std::move(catalog)),
          builder_(std::move(builder)),
          clock_(std::move(clock)),
          pool_(config_.workers > 0 ? config_.workers
                                    : std::max(1u, std::thread::hardware_concurrency())) {}

    ~Impl() { pool_.join(); }

    MatchResult scoreCandidate(const QueryJob& job, const model::Entity& candidate,
                               const model::SchemaCatalog& catalog) {
        MatchResult result;
        result.queryId = job.query.id();
        result.candidateId = candidate.id();
        result.schema = candidate.schema();
        result.algorithm = scoring::algorithmId(job.algorithm);

        try {
            if (!catalog.compatible(job.query.schema(), candidate.schema())) {
                result.diagnostic = kSchemaMismatch;
                stats_.schemaMismatches.fetch_add(1, std::memory_order_relaxed);
            } else {
                auto vector = builder_->build(job.query, candidate, catalog, result.algorithm,
                                              scoring::declaredFeatures(job.algorithm));
                auto outcome = scoring::score(job.algorithm, vector);
                result.score = outcome.score;
                result.features = std::move(outcome.breakdown);
                if (outcome.noEvidence) {
                    result.diagnostic = kNoEvidence;
                }
            }
        } catch (const std::exception& e) {
            spdlog::warn("Scoring {} against {} failed: {}", job.query.id(), candidate.id(),
                         e.what());
            stats_.erroredCandidates.fetch_add(1, std::memory_order_relaxed);
            result.score = 0.0;
            result.features.clear();
            result.errored = true;
            result.diagnostic = fmt::format("{}: {}", kScoringError, e.what());
        }

        result.match = result.score > job.threshold;
        stats_.scoredCandidates.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    /**
     * Fans every job's candidates out to the pool in chunks. Returns once all
     * scheduled chunks have finished.
     */
    void execute(std::vector<QueryJob>& jobs, std::optional<Deadline> deadline,
                 const model::SchemaCatalog& catalog) {
        std::atomic<bool> expired{false};
        auto pastDeadline = [&] {
            if (expired.load(std::memory_order_relaxed)) {
                return true;
            }
            if (deadline && clock_() >= *deadline) {
                expired.store(true, std::memory_order_relaxed);
                return true;
            }
            return false;
        };

        std::vector<std::future<void>> pending;
        for (auto& job : jobs) {
            job.slots.assign(job.candidates.size(), std::nullopt);
            for (size_t start = 0; start < job.candidates.size(); start += config_.chunkSize) {
                const size_t end = std::min(start + config_.chunkSize, job.candidates.size());
                auto task = std::make_shared<std::packaged_task<void()>>(
                    [this, &job, &catalog, &pastDeadline, start, end] {
                        for (size_t i = start; i < end && !pastDeadline(); ++i) {
                            job.slots[i] = scoreCandidate(job, job.candidates[i], catalog);
                        }
                    });
                pending.push_back(task->get_future());
                boost::asio::post(pool_, [task] { (*task)(); });
            }
        }

        for (auto& f : pending) {
            f.wait();
        }
        for (auto& f : pending) {
            f.get();
        }
    }

    QueryResponse rank(QueryJob& job, const std::string& catalogVersion) {
        QueryResponse response;
        response.name = job.name;
        response.algorithm = scoring::algorithmId(job.algorithm);
        response.catalogVersion = catalogVersion;

        auto& ranked = response.ranked;
        ranked.totalCandidates = job.candidates.size();
        for (auto& slot : job.slots) {
            if (!slot) {
                continue;
            }
            ++ranked.scoredCandidates;
            if (slot->errored) {
                ++ranked.erroredCandidates;
            } else if (job.cutoff > 0.0 && slot->score <= job.cutoff) {
                continue;
            }
            ranked.results.push_back(std::move(*slot));
        }
        response.status = ranked.scoredCandidates == ranked.totalCandidates
                              ? QueryStatus::Complete
                              : QueryStatus::TimedOut;

        std::stable_sort(ranked.results.begin(), ranked.results.end(), ranksBefore);
        if (ranked.results.size() > job.topK) {
            ranked.results.erase(ranked.results.begin() + static_cast<ptrdiff_t>(job.topK),
                                 ranked.results.end());
        }
        return response;
    }

    void record(const QueryResponse& response, std::chrono::microseconds elapsed) {
        const auto total = stats_.totalQueries.fetch_add(1, std::memory_order_relaxed) + 1;
        if (response.isComplete()) {
            stats_.completedQueries.fetch_add(1, std::memory_order_relaxed);
        } else {
            stats_.timedOutQueries.fetch_add(1, std::memory_order_relaxed);
        }
        const auto sum = stats_.totalQueryTimeMicros.fetch_add(
                             static_cast<uint64_t>(elapsed.count()), std::memory_order_relaxed) +
                         static_cast<uint64_t>(elapsed.count());
        stats_.avgQueryTimeMicros.store(sum / total, std::memory_order_relaxed);
    }

    std::optional<Deadline> deadlineFor(std::chrono::milliseconds timeout) const {
        if (timeout.count() <= 0) {
            return std::nullopt;
        }
        return clock_() + timeout;
    }

    config::EngineConfig config_;
    std::shared_ptr<model::CatalogHandle> catalog_;
    std::shared_ptr<const features::FeatureSetBuilder> builder_;
    ClockFn clock_;
    Statistics stats_;
    boost::asio::thread_pool pool_;
};

MatchEngine::MatchEngine(std::unique_ptr<Impl> impl) : pImpl_(std::move(impl)) {}

MatchEngine::~MatchEngine() = default;

Result<std::unique_ptr<MatchEngine>>
MatchEngine::create(config::EngineConfig config, std::shared_ptr<model::CatalogHandle> catalog,
                    std::shared_ptr<const normalize::INormalizer> normalizer, ClockFn clock) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!catalog) {
        catalog = std::make_shared<model::CatalogHandle>(model::SchemaCatalog::builtin());
    }
    auto snapshot = catalog->snapshot();
    if (!snapshot) {
        return Error{ErrorCode::InvalidState, "catalog handle holds no catalog"};
    }
    if (auto types = checkFeatureTypes(*snapshot, config); !types) {
        return types.error();
    }

    if (!normalizer) {
        auto made = normalize::makeNormalizer(config.normalizer);
        if (!made && config.normalizer != normalize::NormalizerVariant::Basic) {
            spdlog::warn("{} normalizer unavailable ({}), falling back to basic",
                         normalize::normalizerVariantToString(config.normalizer),
                         made.error().message);
            config.normalizer = normalize::NormalizerVariant::Basic;
            made = normalize::makeNormalizer(config.normalizer);
        }
        if (!made) {
            return made.error();
        }
        normalizer = std::move(made).value();
    } else {
        config.normalizer = normalizer->variant();
    }

    auto comparator = std::make_shared<const compare::ValueComparator>(std::move(normalizer));
    align::AlignerOptions alignerOptions;
    alignerOptions.floor = config.alignerFloor;
    alignerOptions.support = config.alignerSupport;
    auto builder = std::make_shared<const features::FeatureSetBuilder>(
        std::move(comparator), align::MultiValueAligner(alignerOptions));

    if (!clock) {
        clock = [] { return Clock::now(); };
    }

    spdlog::info("Match engine {} ready: catalog {}, {} algorithm(s), default {}, {} normalizer",
                 NAMESAKE_VERSION_STRING, snapshot->version(), config.enabledAlgorithms.size(),
                 scoring::algorithmName(config.defaultAlgorithm),
                 normalize::normalizerVariantToString(config.normalizer));

    auto impl = std::make_unique<Impl>(std::move(config), std::move(catalog), std::move(builder),
                                       std::move(clock));
    return std::unique_ptr<MatchEngine>(new MatchEngine(std::move(impl)));
}

Result<QueryResponse> MatchEngine::match(const model::Entity& query,
                                         std::span<const model::Entity> candidates,
                                         scoring::AlgorithmId algorithm, size_t topK,
                                         std::optional<Deadline> deadline) {
    const auto& config = pImpl_->config_;
    if (!config.isEnabled(algorithm)) {
        return Error{ErrorCode::AlgorithmDisabled,
                     fmt::format("algorithm '{}' is disabled", scoring::algorithmName(algorithm))};
    }
    if (topK == 0) {
        return Error{ErrorCode::InvalidArgument, "topK must be positive"};
    }

    const auto start = std::chrono::steady_clock::now();
    if (!deadline) {
        deadline = pImpl_->deadlineFor(config.deadline);
    }
    auto catalog = pImpl_->catalog_->snapshot();

    std::vector<QueryJob> jobs(1);
    auto& job = jobs.front();
    job.name = query.id();
    job.query = model::prepareQuery(query);
    job.candidates = candidates;
    job.algorithm = scoring::makeAlgorithm(algorithm);
    job.topK = topK;
    job.threshold = config.threshold;
    job.cutoff = config.cutoff;

    try {
        pImpl_->execute(jobs, deadline, *catalog);
    } catch (const std::exception& e) {
        pImpl_->stats_.failedRequests.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Match request for {} failed: {}", query.id(), e.what());
        return Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        pImpl_->stats_.failedRequests.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Match request for {} failed with a non-standard exception", query.id());
        return Error{ErrorCode::InternalError, "unknown failure in scoring task"};
    }

    auto response = pImpl_->rank(job, catalog->version());
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    response.executionTimeMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    pImpl_->record(response, elapsed);

    spdlog::debug("Matched {} against {} candidate(s) with {}: {} result(s), {} in {} ms",
                  query.id(), candidates.size(), scoring::algorithmName(algorithm),
                  response.ranked.size(), queryStatusToString(response.status),
                  response.executionTimeMs);
    return response;
}

Result<BatchResponse> MatchEngine::matchBatch(const std::map<std::string, MatchRequest>& requests,
                                              const MatchParams& params) {
    const auto& config = pImpl_->config_;
    const auto start = std::chrono::steady_clock::now();

    const auto algorithm = params.algorithm.value_or(config.defaultAlgorithm);
    if (!config.isEnabled(algorithm)) {
        return Error{ErrorCode::AlgorithmDisabled,
                     fmt::format("algorithm '{}' is disabled", scoring::algorithmName(algorithm))};
    }
    const size_t limit = params.limit.value_or(config.limit);
    const size_t factor = params.candidateFactor.value_or(config.candidateFactor);
    if (limit == 0 || factor == 0) {
        return Error{ErrorCode::InvalidArgument, "limit and candidate factor must be positive"};
    }
    const double threshold = params.threshold.value_or(config.threshold);
    const double cutoff = params.cutoff.value_or(config.cutoff);
    if (auto r = checkFraction("threshold", threshold); !r) {
        return r.error();
    }
    if (auto r = checkFraction("cutoff", cutoff); !r) {
        return r.error();
    }

    BatchResponse batch;
    const auto deadline = pImpl_->deadlineFor(params.timeout.value_or(config.deadline));
    auto catalog = pImpl_->catalog_->snapshot();
    const size_t wanted = config::candidateLimit(limit, factor);

    auto excluded = [&](const model::Entity& candidate) {
        const bool schema =
            std::any_of(params.excludeSchemas.begin(), params.excludeSchemas.end(),
                        [&](const std::string& s) { return catalog->isA(candidate.schema(), s); });
        return schema || std::find(params.excludeIds.begin(), params.excludeIds.end(),
                                   candidate.id()) != params.excludeIds.end();
    };

    std::vector<QueryJob> jobs(requests.size());
    size_t index = 0;
    for (const auto& [name, request] : requests) {
        auto& job = jobs[index++];
        job.name = name;
        job.query = model::prepareQuery(request.query);
        job.algorithm = scoring::makeAlgorithm(algorithm);
        job.topK = limit;
        job.threshold = threshold;
        job.cutoff = cutoff;

        for (const auto& candidate : request.candidates) {
            if (job.owned.size() == wanted) {
                spdlog::debug("Query '{}': keeping the first {} of {} candidates", name, wanted,
                              request.candidates.size());
                break;
            }
            if (!excluded(candidate)) {
                job.owned.push_back(candidate);
            }
        }
        job.candidates = job.owned;
    }

    batch.state = RequestState::Scoring;
    spdlog::debug("Batch of {} quer{} is {}", jobs.size(), jobs.size() == 1 ? "y" : "ies",
                  requestStateToString(batch.state));
    try {
        pImpl_->execute(jobs, deadline, *catalog);
    } catch (const std::exception& e) {
        pImpl_->stats_.failedRequests.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Batch match failed: {}", e.what());
        return Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        pImpl_->stats_.failedRequests.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Batch match failed with a non-standard exception");
        return Error{ErrorCode::InternalError, "unknown failure in scoring task"};
    }

    batch.state = RequestState::Ranking;
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    for (auto& job : jobs) {
        auto response = pImpl_->rank(job, catalog->version());
        response.executionTimeMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        pImpl_->record(response, elapsed);
        if (!response.isComplete()) {
            batch.timedOutQueries.push_back(job.name);
        }
        batch.responses.emplace(job.name, std::move(response));
    }

    batch.state = batch.timedOutQueries.empty() ? RequestState::Complete : RequestState::TimedOut;
    batch.executionTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
    if (!batch.isComplete()) {
        spdlog::warn("Batch deadline expired: {} of {} queries incomplete",
                     batch.timedOutQueries.size(), jobs.size());
    }
    return batch;
}

std::vector<scoring::AlgorithmId> MatchEngine::listAlgorithms() const {
    std::vector<scoring::AlgorithmId> ids;
    for (auto id : scoring::kAllAlgorithms) {
        if (pImpl_->config_.isEnabled(id)) {
            ids.push_back(id);
        }
    }
    return ids;
}

const config::EngineConfig& MatchEngine::getConfig() const {
    return pImpl_->config_;
}

std::shared_ptr<model::CatalogHandle> MatchEngine::catalog() const {
    return pImpl_->catalog_;
}

const MatchEngine::Statistics& MatchEngine::getStatistics() const {
    return pImpl_->stats_;
}

void MatchEngine::resetStatistics() {
    auto& s = pImpl_->stats_;
    for (auto* counter : {&s.totalQueries, &s.completedQueries, &s.timedOutQueries,
                          &s.failedRequests, &s.scoredCandidates, &s.erroredCandidates,
                          &s.schemaMismatches, &s.totalQueryTimeMicros, &s.avgQueryTimeMicros}) {
        counter->store(0, std::memory_order_relaxed);
    }
}

} // namespace namesake::engine
