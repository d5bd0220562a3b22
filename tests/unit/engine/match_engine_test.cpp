#include <gtest/gtest.h>
#include <namesake/engine/match_engine.h>

#include <atomic>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace namesake;
using namespace namesake::engine;
using model::Entity;
using scoring::AlgorithmId;

namespace {

// Fails on any value containing "boom"; otherwise behaves like the basic normalizer
class ThrowingNormalizer : public normalize::INormalizer {
public:
    std::string normalize(std::string_view text) const override {
        if (text.find("boom") != std::string_view::npos) {
            throw std::runtime_error("cannot normalize '" + std::string(text) + "'");
        }
        return basic_.normalize(text);
    }
    normalize::NormalizerVariant variant() const noexcept override {
        return normalize::NormalizerVariant::Basic;
    }

private:
    normalize::BasicNormalizer basic_;
};

Entity person(std::string id, std::string name, std::string birthDate = {}) {
    auto builder = Entity::builder("Person");
    builder.id(std::move(id)).property("name", std::move(name));
    if (!birthDate.empty()) {
        builder.property("birthDate", std::move(birthDate));
    }
    return std::move(builder).build();
}

} // namespace

class MatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.workers = 4;
        config_.chunkSize = 2;

        candidates_ = {
            person("c00", "Vladimir Putin"),   person("c01", "Vladimir Putina"),
            person("c02", "Vladimir Poutine"), person("c03", "Vova Putin"),
            person("c04", "Wladimir Putin"),   person("c05", "John Smith"),
            person("c06", "Jane Doe"),         person("c07", "Maria Ivanova"),
            person("c08", "Putin"),            person("c09", "Vladimir Petrov"),
        };
    }

    std::unique_ptr<MatchEngine> makeEngine(
        std::shared_ptr<const normalize::INormalizer> normalizer = nullptr,
        MatchEngine::ClockFn clock = {}) {
        auto engine = MatchEngine::create(config_, nullptr, std::move(normalizer), std::move(clock));
        EXPECT_TRUE(engine) << (engine ? "" : engine.error().message);
        return engine ? std::move(engine).value() : nullptr;
    }

    static void expectRanked(const RankedResultSet& ranked) {
        for (size_t i = 1; i < ranked.results.size(); ++i) {
            const auto& prev = ranked.results[i - 1];
            const auto& cur = ranked.results[i];
            EXPECT_GE(prev.score, cur.score);
            if (prev.score == cur.score) {
                EXPECT_LT(prev.candidateId, cur.candidateId);
            }
        }
    }

    config::EngineConfig config_;
    std::vector<Entity> candidates_;
};

TEST_F(MatchEngineTest, ReturnsTopKInDescendingOrder) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto response =
        engine->match(person("q", "Vladimir Putin"), candidates_, AlgorithmId::LogicV1, 3);
    ASSERT_TRUE(response) << response.error().message;

    const auto& r = response.value();
    EXPECT_TRUE(r.isComplete());
    EXPECT_EQ(r.algorithm, AlgorithmId::LogicV1);
    EXPECT_EQ(r.ranked.totalCandidates, 10u);
    EXPECT_EQ(r.ranked.scoredCandidates, 10u);
    ASSERT_EQ(r.ranked.size(), 3u);
    expectRanked(r.ranked);

    const auto& top = r.ranked.results.front();
    EXPECT_EQ(top.candidateId, "c00");
    EXPECT_EQ(top.queryId, "q");
    EXPECT_NEAR(top.score, 0.99331, 1e-5);
    EXPECT_TRUE(top.match);
    EXPECT_FALSE(top.features.empty());
}

TEST_F(MatchEngineTest, ExtraWeakAliasesDoNotLowerExactMatch) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto query = Entity::builder("Person")
                     .id("q")
                     .property("name", PropertyValues{"Vladimir Putin", "Ivan Ivanov",
                                                      "Petr Petrov"})
                     .build();
    auto aliased = Entity::builder("Person")
                       .id("a-aliased")
                       .property("name", "Vladimir Putin")
                       .property("alias", PropertyValues{"Ivana Petrova", "Pyotr Ivanovich",
                                                         "Vlad Popov"})
                       .build();
    std::vector<Entity> pair = {aliased, person("b-plain", "Vladimir Putin")};

    for (auto algorithm : {AlgorithmId::NameBased, AlgorithmId::NameQualified}) {
        auto response = engine->match(query, pair, algorithm, 2);
        ASSERT_TRUE(response) << response.error().message;
        const auto& results = response.value().ranked.results;
        ASSERT_EQ(results.size(), 2u);

        // Equal scores fall back to id order, so the aliased entity stays first
        EXPECT_EQ(results[0].candidateId, "a-aliased") << scoring::algorithmName(algorithm);
        EXPECT_DOUBLE_EQ(results[0].score, results[1].score) << scoring::algorithmName(algorithm);
        EXPECT_NEAR(results[0].score, 1.0, 1e-9) << scoring::algorithmName(algorithm);
        EXPECT_TRUE(results[0].match);
    }
}

TEST_F(MatchEngineTest, DeadlineKeepsFinishedCandidates) {
    config_.workers = 1;
    config_.chunkSize = 1;

    const auto t0 = Clock::now();
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto clock = [t0, calls] {
        return calls->fetch_add(1) < 4 ? t0 : t0 + std::chrono::hours(1);
    };
    auto engine = makeEngine(nullptr, clock);
    ASSERT_NE(engine, nullptr);

    auto response = engine->match(person("q", "Vladimir Putin"), candidates_,
                                  AlgorithmId::NameBased, 10, t0 + std::chrono::seconds(1));
    ASSERT_TRUE(response);

    const auto& r = response.value();
    EXPECT_EQ(r.status, QueryStatus::TimedOut);
    EXPECT_FALSE(r.isComplete());
    EXPECT_EQ(r.ranked.totalCandidates, 10u);
    EXPECT_EQ(r.ranked.scoredCandidates, 4u);
    ASSERT_EQ(r.ranked.size(), 4u);
    for (const auto& result : r.ranked.results) {
        EXPECT_LT(result.candidateId, "c04");
    }
    expectRanked(r.ranked);
    EXPECT_EQ(engine->getStatistics().timedOutQueries.load(), 1u);
}

TEST_F(MatchEngineTest, BatchDeadlineIsSharedAcrossQueries) {
    config_.workers = 1;
    config_.chunkSize = 1;

    // One clock read fixes the deadline, then one read per candidate before it starts
    const auto t0 = Clock::now();
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto clock = [t0, calls] {
        return calls->fetch_add(1) < 4 ? t0 : t0 + std::chrono::hours(1);
    };
    auto engine = makeEngine(nullptr, clock);
    ASSERT_NE(engine, nullptr);

    std::vector<Entity> first(candidates_.begin(), candidates_.begin() + 3);
    std::map<std::string, MatchRequest> requests;
    requests["alpha"] = MatchRequest{person("q1", "Vladimir Putin"), first};
    requests["beta"] = MatchRequest{person("q2", "John Smith"), candidates_};
    requests["gamma"] = MatchRequest{person("q3", "Jane Doe"), candidates_};

    MatchParams params;
    params.algorithm = AlgorithmId::NameBased;
    params.limit = 5;
    params.timeout = std::chrono::milliseconds(1000);

    auto batch = engine->matchBatch(requests, params);
    ASSERT_TRUE(batch) << batch.error().message;
    const auto& b = batch.value();
    EXPECT_EQ(b.state, RequestState::TimedOut);
    EXPECT_FALSE(b.isComplete());
    ASSERT_EQ(b.responses.size(), 3u);
    ASSERT_EQ(b.timedOutQueries.size(), 2u);
    EXPECT_EQ(b.timedOutQueries[0], "beta");
    EXPECT_EQ(b.timedOutQueries[1], "gamma");

    const auto& alpha = b.responses.at("alpha");
    EXPECT_EQ(alpha.status, QueryStatus::Complete);
    EXPECT_EQ(alpha.ranked.scoredCandidates, 3u);
    ASSERT_EQ(alpha.ranked.size(), 3u);
    EXPECT_EQ(alpha.ranked.results.front().candidateId, "c00");
    EXPECT_NEAR(alpha.ranked.results.front().score, 1.0, 1e-9);
    expectRanked(alpha.ranked);

    for (const char* name : {"beta", "gamma"}) {
        const auto& late = b.responses.at(name);
        EXPECT_EQ(late.status, QueryStatus::TimedOut) << name;
        EXPECT_EQ(late.ranked.totalCandidates, candidates_.size()) << name;
        EXPECT_EQ(late.ranked.scoredCandidates, 0u) << name;
        EXPECT_TRUE(late.ranked.results.empty()) << name;
    }

    const auto& stats = engine->getStatistics();
    EXPECT_EQ(stats.completedQueries.load(), 1u);
    EXPECT_EQ(stats.timedOutQueries.load(), 2u);
}

TEST_F(MatchEngineTest, ResultsDoNotDependOnScheduling) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);
    const auto query = person("q", "Vladimir Putin", "1952-10-07");

    auto first = engine->match(query, candidates_, AlgorithmId::NameQualified, 10);
    ASSERT_TRUE(first);
    for (int run = 0; run < 5; ++run) {
        auto again = engine->match(query, candidates_, AlgorithmId::NameQualified, 10);
        ASSERT_TRUE(again);
        ASSERT_EQ(again.value().ranked.size(), first.value().ranked.size());
        for (size_t i = 0; i < first.value().ranked.size(); ++i) {
            EXPECT_EQ(again.value().ranked.results[i].candidateId,
                      first.value().ranked.results[i].candidateId);
            EXPECT_DOUBLE_EQ(again.value().ranked.results[i].score,
                             first.value().ranked.results[i].score);
        }
    }
}

TEST_F(MatchEngineTest, AbsentPropertiesAreNeutral) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);
    std::vector<Entity> one = {person("c", "Vladimir Putin")};

    for (auto id : scoring::kAllAlgorithms) {
        auto plain = engine->match(person("q", "Vladimir Putin"), one, id, 1);
        auto dated = engine->match(person("q", "Vladimir Putin", "1952-10-07"), one, id, 1);
        ASSERT_TRUE(plain);
        ASSERT_TRUE(dated);
        EXPECT_DOUBLE_EQ(plain.value().ranked.results[0].score,
                         dated.value().ranked.results[0].score)
            << scoring::algorithmName(id);
    }
}

TEST_F(MatchEngineTest, IncompatibleSchemasScoreZero) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);
    std::vector<Entity> candidates = {
        Entity("v1", "Vessel", {{"name", {"Vladimir Putin"}}}),
        Entity("t1", "Thing", {{"name", {"Vladimir Putin"}}}),
    };

    auto response =
        engine->match(person("q", "Vladimir Putin"), candidates, AlgorithmId::LogicV1, 5);
    ASSERT_TRUE(response);
    ASSERT_EQ(response.value().ranked.size(), 2u);
    for (const auto& result : response.value().ranked.results) {
        EXPECT_DOUBLE_EQ(result.score, 0.0);
        EXPECT_FALSE(result.match);
        EXPECT_FALSE(result.errored);
        EXPECT_EQ(result.diagnostic, kSchemaMismatch);
    }
    EXPECT_EQ(engine->getStatistics().schemaMismatches.load(), 2u);
}

TEST_F(MatchEngineTest, FailingCandidateDoesNotFailTheRequest) {
    auto engine = makeEngine(std::make_shared<ThrowingNormalizer>());
    ASSERT_NE(engine, nullptr);
    std::vector<Entity> candidates = {person("bad", "boom"), person("good", "Vladimir Putin")};

    auto response =
        engine->match(person("q", "Vladimir Putin"), candidates, AlgorithmId::NameBased, 5);
    ASSERT_TRUE(response);

    const auto& ranked = response.value().ranked;
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked.erroredCandidates, 1u);
    EXPECT_EQ(ranked.results[0].candidateId, "good");
    EXPECT_DOUBLE_EQ(ranked.results[0].score, 1.0);

    const auto& bad = ranked.results[1];
    EXPECT_EQ(bad.candidateId, "bad");
    EXPECT_TRUE(bad.errored);
    EXPECT_DOUBLE_EQ(bad.score, 0.0);
    EXPECT_EQ(bad.diagnostic.rfind(kScoringError, 0), 0u);
    EXPECT_NE(bad.diagnostic.find("cannot normalize"), std::string::npos);
}

TEST_F(MatchEngineTest, CutoffDropsWeakResults) {
    config_.cutoff = 0.5;
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);
    std::vector<Entity> candidates = {person("a", "Vladimir Putin"),
                                      Entity("v", "Vessel", {{"name", {"Vladimir Putin"}}})};

    auto response =
        engine->match(person("q", "Vladimir Putin"), candidates, AlgorithmId::LogicV1, 5);
    ASSERT_TRUE(response);
    ASSERT_EQ(response.value().ranked.size(), 1u);
    EXPECT_EQ(response.value().ranked.results[0].candidateId, "a");
    EXPECT_EQ(response.value().ranked.scoredCandidates, 2u);
}

TEST_F(MatchEngineTest, EmptyQueryHasNoEvidence) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto response = engine->match(Entity("q", "Person"), candidates_, AlgorithmId::LogicV1, 10);
    ASSERT_TRUE(response);
    for (const auto& result : response.value().ranked.results) {
        EXPECT_DOUBLE_EQ(result.score, 0.0);
        EXPECT_EQ(result.diagnostic, kNoEvidence);
    }
}

TEST_F(MatchEngineTest, RejectsDisabledAlgorithmAndZeroLimit) {
    config_.enabledAlgorithms = {AlgorithmId::NameBased};
    config_.defaultAlgorithm = AlgorithmId::NameBased;
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto disabled = engine->match(person("q", "x"), candidates_, AlgorithmId::LogicV1, 3);
    ASSERT_FALSE(disabled);
    EXPECT_EQ(disabled.error().code, ErrorCode::AlgorithmDisabled);

    auto zero = engine->match(person("q", "x"), candidates_, AlgorithmId::NameBased, 0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidArgument);

    MatchParams params;
    params.algorithm = AlgorithmId::NameQualified;
    auto batch = engine->matchBatch({}, params);
    ASSERT_FALSE(batch);
    EXPECT_EQ(batch.error().code, ErrorCode::AlgorithmDisabled);
}

TEST_F(MatchEngineTest, ListAlgorithmsIsStable) {
    config_.enabledAlgorithms = {AlgorithmId::LogicV1, AlgorithmId::NameBased};
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto first = engine->listAlgorithms();
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0], AlgorithmId::NameBased);
    EXPECT_EQ(first[1], AlgorithmId::LogicV1);
    EXPECT_EQ(engine->listAlgorithms(), first);
    EXPECT_EQ(engine->getConfig().defaultAlgorithm, AlgorithmId::LogicV1);
}

TEST_F(MatchEngineTest, BatchAppliesExclusionsAndLimits) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    std::map<std::string, MatchRequest> requests;
    requests["putin"] = MatchRequest{
        person("q1", "Vladimir Putin"),
        {person("p1", "Vladimir Putin"), person("skip", "Vladimir Putin"),
         Entity("org", "Company", {{"name", {"Vladimir Putin"}}})}};
    requests["smith"] = MatchRequest{person("q2", "John Smith"), candidates_};

    MatchParams params;
    params.algorithm = AlgorithmId::NameBased;
    params.limit = 2;
    params.excludeSchemas = {"Organization"};
    params.excludeIds = {"skip"};

    auto batch = engine->matchBatch(requests, params);
    ASSERT_TRUE(batch) << batch.error().message;
    const auto& b = batch.value();
    EXPECT_TRUE(b.isComplete());
    EXPECT_EQ(b.state, RequestState::Complete);
    EXPECT_TRUE(b.timedOutQueries.empty());
    ASSERT_EQ(b.responses.size(), 2u);

    const auto& putin = b.responses.at("putin");
    EXPECT_EQ(putin.name, "putin");
    EXPECT_EQ(putin.algorithm, AlgorithmId::NameBased);
    EXPECT_EQ(putin.ranked.totalCandidates, 1u);
    ASSERT_EQ(putin.ranked.size(), 1u);
    EXPECT_EQ(putin.ranked.results[0].candidateId, "p1");

    const auto& smith = b.responses.at("smith");
    EXPECT_EQ(smith.ranked.size(), 2u);
    EXPECT_EQ(smith.ranked.results[0].candidateId, "c05");
}

TEST_F(MatchEngineTest, BatchCapsCandidatesPerQuery) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    std::vector<Entity> many;
    for (int i = 0; i < 30; ++i) {
        many.push_back(person("c" + std::to_string(100 + i), "Jane Doe"));
    }
    std::map<std::string, MatchRequest> requests;
    requests["doe"] = MatchRequest{person("q", "Jane Doe"), many};

    MatchParams params;
    params.limit = 1;
    params.candidateFactor = 1;
    auto batch = engine->matchBatch(requests, params);
    ASSERT_TRUE(batch);

    const auto& doe = batch.value().responses.at("doe");
    EXPECT_EQ(doe.ranked.totalCandidates, config::kMinCandidates);
    ASSERT_EQ(doe.ranked.size(), 1u);
    // Equal scores rank by candidate id
    EXPECT_EQ(doe.ranked.results[0].candidateId, "c100");
}

TEST_F(MatchEngineTest, BatchValidatesParameters) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    MatchParams params;
    params.threshold = 1.5;
    auto r = engine->matchBatch({}, params);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    MatchParams zero;
    zero.limit = 0;
    auto z = engine->matchBatch({}, zero);
    ASSERT_FALSE(z);
    EXPECT_EQ(z.error().code, ErrorCode::InvalidArgument);

    MatchParams nan;
    nan.cutoff = std::numeric_limits<double>::quiet_NaN();
    auto n = engine->matchBatch({}, nan);
    ASSERT_FALSE(n);
    EXPECT_EQ(n.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MatchEngineTest, CreateValidatesConfiguration) {
    config_.enabledAlgorithms.clear();
    auto r = MatchEngine::create(config_);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(MatchEngineTest, CreateRejectsMistypedProperties) {
    auto defs = model::SchemaCatalog::builtinDefinitions();
    for (auto& def : defs) {
        if (def.name == "Person") {
            for (auto& prop : def.properties) {
                if (prop.name == "birthDate") {
                    prop.type = "text";
                }
            }
        }
    }
    auto catalog = model::SchemaCatalog::create("mistyped", defs);
    ASSERT_TRUE(catalog);

    auto handle = std::make_shared<model::CatalogHandle>(std::move(catalog).value());
    auto r = MatchEngine::create(config_, handle);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::UnsupportedProperty);
}

TEST_F(MatchEngineTest, UsesTheCurrentCatalogSnapshot) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    auto before = engine->match(person("q", "Jane Doe"), candidates_, AlgorithmId::NameBased, 1);
    ASSERT_TRUE(before);
    EXPECT_EQ(before.value().catalogVersion, model::SchemaCatalog::builtin()->version());

    auto replacement =
        model::SchemaCatalog::create("test-2", model::SchemaCatalog::builtinDefinitions());
    ASSERT_TRUE(replacement);
    ASSERT_TRUE(engine->catalog()->swap(std::move(replacement).value()));

    auto after = engine->match(person("q", "Jane Doe"), candidates_, AlgorithmId::NameBased, 1);
    ASSERT_TRUE(after);
    EXPECT_EQ(after.value().catalogVersion, "test-2");
}

TEST_F(MatchEngineTest, Statistics) {
    auto engine = makeEngine();
    ASSERT_NE(engine, nullptr);

    ASSERT_TRUE(engine->match(person("q", "Jane Doe"), candidates_, AlgorithmId::LogicV1, 3));
    const auto& stats = engine->getStatistics();
    EXPECT_EQ(stats.totalQueries.load(), 1u);
    EXPECT_EQ(stats.completedQueries.load(), 1u);
    EXPECT_EQ(stats.scoredCandidates.load(), 10u);

    engine->resetStatistics();
    EXPECT_EQ(stats.totalQueries.load(), 0u);
    EXPECT_EQ(stats.scoredCandidates.load(), 0u);
}
