#pragma once

#include <namesake/core/types.h>
#include <namesake/normalize/normalizer.h>
#include <namesake/scoring/algorithm_id.h>

#include <chrono>
#include <filesystem>
#include <vector>

namespace namesake::config {

/**
 * @brief Engine settings, read from the [matching] section of the config file
 *
 * Example:
 * @code
 * [matching]
 * algorithms = ["logic-v1", "name-based"]
 * default_algorithm = "logic-v1"
 * normalizer = "full"
 * workers = 4
 * limit = 5
 * threshold = 0.7
 * cutoff = 0.0
 * candidate_factor = 10
 * deadline_ms = 2000
 * @endcode
 */
struct EngineConfig {
    std::vector<scoring::AlgorithmId> enabledAlgorithms{scoring::kAllAlgorithms.begin(),
                                                        scoring::kAllAlgorithms.end()};
    scoring::AlgorithmId defaultAlgorithm = scoring::AlgorithmId::LogicV1;
    normalize::NormalizerVariant normalizer = normalize::NormalizerVariant::Basic;

    size_t workers = 0;     // 0 = hardware concurrency
    size_t chunkSize = 16;  // candidates per scheduled task
    size_t limit = 5;       // default top-K
    double threshold = 0.7; // match flag is set above this score
    double cutoff = 0.0;    // results at or below are dropped when > 0
    size_t candidateFactor = 10;
    std::chrono::milliseconds deadline{0}; // 0 = no deadline

    double alignerFloor = 0.05;
    double alignerSupport = 0.5;

    bool isEnabled(scoring::AlgorithmId id) const;

    Result<void> validate() const;
};

inline constexpr size_t kMinCandidates = 20;
inline constexpr size_t kMaxCandidates = 9999;

/**
 * @brief Number of candidates to request for a top-K limit
 */
size_t candidateLimit(size_t limit, size_t factor);

/**
 * @brief Load settings; a missing file yields defaults, malformed values fail
 *
 * An empty path resolves through get_config_path(), so NAMESAKE_CONFIG and the
 * XDG location apply.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);

} // namespace namesake::config
