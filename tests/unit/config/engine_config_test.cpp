#include <gtest/gtest.h>
#include <namesake/config/config_helpers.h>
#include <namesake/config/engine_config.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace namesake;
using namespace namesake::config;
using scoring::AlgorithmId;

namespace fs = std::filesystem;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = fs::temp_directory_path() /
               ("namesake_config_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                              ->random_seed()) +
                "_" + std::to_string(counter.fetch_add(1)));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeConfig(const std::string& content) {
        auto path = dir_ / "config.toml";
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(EngineConfigTest, MissingFileYieldsDefaults) {
    auto result = loadEngineConfig(dir_ / "absent.toml");
    ASSERT_TRUE(result) << result.error().message;
    const auto& config = result.value();
    EXPECT_EQ(config.enabledAlgorithms.size(), scoring::kAllAlgorithms.size());
    EXPECT_EQ(config.defaultAlgorithm, AlgorithmId::LogicV1);
    EXPECT_EQ(config.normalizer, normalize::NormalizerVariant::Basic);
    EXPECT_EQ(config.limit, 5u);
    EXPECT_DOUBLE_EQ(config.threshold, 0.7);
    EXPECT_DOUBLE_EQ(config.cutoff, 0.0);
    EXPECT_EQ(config.candidateFactor, 10u);
    EXPECT_EQ(config.deadline.count(), 0);
}

TEST_F(EngineConfigTest, ReadsMatchingSection) {
    auto path = writeConfig(R"(
[other]
limit = 99

[matching]
algorithms = ["name-based", "logic-v1"]   # two of three
default_algorithm = "name-based"
normalizer = "full"
workers = 3
limit = 7
threshold = 0.8
cutoff = 0.25
candidate_factor = 4
deadline_ms = 1500
aligner_floor = 0.1
aligner_support = 0.25
)");
    auto result = loadEngineConfig(path);
    ASSERT_TRUE(result) << result.error().message;
    const auto& config = result.value();
    ASSERT_EQ(config.enabledAlgorithms.size(), 2u);
    EXPECT_EQ(config.enabledAlgorithms[0], AlgorithmId::NameBased);
    EXPECT_EQ(config.enabledAlgorithms[1], AlgorithmId::LogicV1);
    EXPECT_FALSE(config.isEnabled(AlgorithmId::NameQualified));
    EXPECT_EQ(config.defaultAlgorithm, AlgorithmId::NameBased);
    EXPECT_EQ(config.normalizer, normalize::NormalizerVariant::Full);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.limit, 7u);
    EXPECT_DOUBLE_EQ(config.threshold, 0.8);
    EXPECT_DOUBLE_EQ(config.cutoff, 0.25);
    EXPECT_EQ(config.candidateFactor, 4u);
    EXPECT_EQ(config.deadline.count(), 1500);
    EXPECT_DOUBLE_EQ(config.alignerFloor, 0.1);
    EXPECT_DOUBLE_EQ(config.alignerSupport, 0.25);
}

TEST_F(EngineConfigTest, DottedKeysOutsideSection) {
    auto path = writeConfig("matching.limit = 12\n");
    auto result = loadEngineConfig(path);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().limit, 12u);
}

TEST_F(EngineConfigTest, DefaultFollowsEnabledListWhenUnset) {
    auto path = writeConfig("[matching]\nalgorithms = name-qualified\n");
    auto result = loadEngineConfig(path);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().defaultAlgorithm, AlgorithmId::NameQualified);
}

TEST_F(EngineConfigTest, UnknownAlgorithmIsConfigurationError) {
    auto path = writeConfig("[matching]\nalgorithms = [\"logic-v9\"]\n");
    auto result = loadEngineConfig(path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(EngineConfigTest, MalformedNumbersAreRejected) {
    for (const char* line : {"limit = five", "threshold = 0.7x", "deadline_ms = -5",
                             "workers = 2.5", "normalizer = \"fancy\""}) {
        auto path = writeConfig(std::string("[matching]\n") + line + "\n");
        auto result = loadEngineConfig(path);
        ASSERT_FALSE(result) << line;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration) << line;
    }
}

TEST_F(EngineConfigTest, NonFiniteNumbersAreRejected) {
    for (const char* line : {"threshold = nan", "cutoff = NaN", "aligner_support = inf",
                             "aligner_floor = -inf"}) {
        auto path = writeConfig(std::string("[matching]\n") + line + "\n");
        auto result = loadEngineConfig(path);
        ASSERT_FALSE(result) << line;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration) << line;
    }

    EngineConfig config;
    config.threshold = std::numeric_limits<double>::quiet_NaN();
    auto nanThreshold = config.validate();
    ASSERT_FALSE(nanThreshold);
    EXPECT_EQ(nanThreshold.error().code, ErrorCode::InvalidConfiguration);

    config = EngineConfig{};
    config.alignerSupport = std::numeric_limits<double>::infinity();
    auto infSupport = config.validate();
    ASSERT_FALSE(infSupport);
    EXPECT_EQ(infSupport.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(EngineConfigTest, OutOfRangeValuesFailValidation) {
    auto path = writeConfig("[matching]\nthreshold = 1.5\n");
    auto result = loadEngineConfig(path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(EngineConfigTest, DisabledDefaultAlgorithmFailsValidation) {
    EngineConfig config;
    config.enabledAlgorithms = {AlgorithmId::NameBased};
    config.defaultAlgorithm = AlgorithmId::LogicV1;
    auto valid = config.validate();
    ASSERT_FALSE(valid);
    EXPECT_EQ(valid.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(EngineConfigTest, CandidateLimitIsClamped) {
    EXPECT_EQ(candidateLimit(5, 10), 50u);
    EXPECT_EQ(candidateLimit(1, 10), kMinCandidates);
    EXPECT_EQ(candidateLimit(5000, 10), kMaxCandidates);
    EXPECT_EQ(candidateLimit(static_cast<size_t>(-1), 10), kMaxCandidates);
}

TEST_F(EngineConfigTest, EnvironmentSelectsConfigPath) {
    auto path = writeConfig("[matching]\nlimit = 3\n");
    ASSERT_EQ(::setenv("NAMESAKE_CONFIG", path.c_str(), 1), 0);
    EXPECT_EQ(get_config_path(), path);
    EXPECT_EQ(get_config_path("/explicit/config.toml"), fs::path("/explicit/config.toml"));
    ::unsetenv("NAMESAKE_CONFIG");
}

TEST_F(EngineConfigTest, EmptyPathLoadsFileNamedByEnvironment) {
    auto path = writeConfig("[matching]\nlimit = 3\nthreshold = 0.9\n");
    ASSERT_EQ(::setenv("NAMESAKE_CONFIG", path.c_str(), 1), 0);
    auto result = loadEngineConfig({});
    ::unsetenv("NAMESAKE_CONFIG");

    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().limit, 3u);
    EXPECT_DOUBLE_EQ(result.value().threshold, 0.9);

    // An explicit path still wins over the environment
    auto other = writeConfig("[matching]\nlimit = 8\n");
    ASSERT_EQ(::setenv("NAMESAKE_CONFIG", (dir_ / "absent.toml").c_str(), 1), 0);
    auto explicitResult = loadEngineConfig(other);
    ::unsetenv("NAMESAKE_CONFIG");
    ASSERT_TRUE(explicitResult) << explicitResult.error().message;
    EXPECT_EQ(explicitResult.value().limit, 8u);
}

TEST(ConfigHelpersTest, ParseListAcceptsArraysAndCommaLists) {
    auto a = parse_list(R"(["a", 'b' , c])");
    ASSERT_EQ(a.size(), 3u);
    EXPECT_EQ(a[0], "a");
    EXPECT_EQ(a[1], "b");
    EXPECT_EQ(a[2], "c");

    auto b = parse_list("x, y,,z");
    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(b[2], "z");

    EXPECT_TRUE(parse_list("").empty());
}

TEST(ConfigHelpersTest, ParseMs) {
    ASSERT_TRUE(parse_ms("250").has_value());
    EXPECT_EQ(parse_ms("250")->count(), 250);
    EXPECT_FALSE(parse_ms("").has_value());
    EXPECT_FALSE(parse_ms("12ms").has_value());
    EXPECT_FALSE(parse_ms("-1").has_value());
}

TEST(ConfigHelpersTest, UnquoteAndTrim) {
    EXPECT_EQ(unquote("  \"value\" "), "value");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
    std::string s = "\t padded \n";
    trim(s);
    EXPECT_EQ(s, "padded");
}
