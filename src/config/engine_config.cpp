#include <namesake/config/config_helpers.h>
#include <namesake/config/engine_config.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <spdlog/spdlog.h>

namespace namesake::config {

namespace {

constexpr const char* kSection = "matching";

Error invalid(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidConfiguration,
                 "invalid value '" + value + "' for " + kSection + "." + key};
}

Result<size_t> parseCount(const std::string& key, const std::string& raw) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return invalid(key, raw);
    }
    return value;
}

Result<double> parseFraction(const std::string& key, const std::string& raw) {
    try {
        size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != raw.size() || !std::isfinite(value)) {
            return invalid(key, raw);
        }
        return value;
    } catch (const std::exception&) {
        return invalid(key, raw);
    }
}

} // namespace

bool EngineConfig::isEnabled(scoring::AlgorithmId id) const {
    return std::find(enabledAlgorithms.begin(), enabledAlgorithms.end(), id) !=
           enabledAlgorithms.end();
}

Result<void> EngineConfig::validate() const {
    if (enabledAlgorithms.empty()) {
        return Error{ErrorCode::InvalidConfiguration, "no scoring algorithm is enabled"};
    }
    if (!isEnabled(defaultAlgorithm)) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string("default algorithm '") +
                         scoring::algorithmName(defaultAlgorithm) + "' is not enabled"};
    }
    if (limit == 0) {
        return Error{ErrorCode::InvalidConfiguration, "limit must be positive"};
    }
    if (chunkSize == 0) {
        return Error{ErrorCode::InvalidConfiguration, "chunk size must be positive"};
    }
    if (candidateFactor == 0) {
        return Error{ErrorCode::InvalidConfiguration, "candidate factor must be positive"};
    }
    if (!std::isfinite(threshold) || !std::isfinite(cutoff) || threshold < 0.0 ||
        threshold > 1.0 || cutoff < 0.0 || cutoff > 1.0) {
        return Error{ErrorCode::InvalidConfiguration, "threshold and cutoff must lie in [0,1]"};
    }
    if (!std::isfinite(alignerFloor) || !std::isfinite(alignerSupport) || alignerFloor < 0.0 ||
        alignerFloor > 1.0 || alignerSupport < 0.0 || alignerSupport > 1.0) {
        return Error{ErrorCode::InvalidConfiguration, "invalid aligner settings"};
    }
    return {};
}

size_t candidateLimit(size_t limit, size_t factor) {
    const size_t wanted = limit > kMaxCandidates / std::max<size_t>(factor, 1)
                              ? kMaxCandidates
                              : limit * factor;
    return std::clamp(wanted, kMinCandidates, kMaxCandidates);
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& requested) {
    EngineConfig config;
    const auto path = requested.empty() ? get_config_path() : requested;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("Config file '{}' not found, using matching defaults", path.string());
        return config;
    }

    auto value = [&](const char* key) { return parse_config_value(path, kSection, key); };

    if (auto raw = value("algorithms"); !raw.empty()) {
        config.enabledAlgorithms.clear();
        for (const auto& name : parse_list(raw)) {
            auto id = scoring::parseAlgorithm(name);
            if (!id) {
                return Error{ErrorCode::InvalidConfiguration, id.error().message};
            }
            if (!config.isEnabled(id.value())) {
                config.enabledAlgorithms.push_back(id.value());
            }
        }
    }
    if (auto raw = value("default_algorithm"); !raw.empty()) {
        auto id = scoring::parseAlgorithm(raw);
        if (!id) {
            return Error{ErrorCode::InvalidConfiguration, id.error().message};
        }
        config.defaultAlgorithm = id.value();
    } else if (!config.isEnabled(config.defaultAlgorithm) && !config.enabledAlgorithms.empty()) {
        config.defaultAlgorithm = config.enabledAlgorithms.front();
    }
    if (auto raw = value("normalizer"); !raw.empty()) {
        auto variant = normalize::parseNormalizerVariant(raw);
        if (!variant) {
            return invalid("normalizer", raw);
        }
        config.normalizer = *variant;
    }

    struct CountKey {
        const char* key;
        size_t* target;
    };
    for (auto [key, target] : {CountKey{"workers", &config.workers},
                               CountKey{"chunk_size", &config.chunkSize},
                               CountKey{"limit", &config.limit},
                               CountKey{"candidate_factor", &config.candidateFactor}}) {
        if (auto raw = value(key); !raw.empty()) {
            auto parsed = parseCount(key, raw);
            if (!parsed) {
                return parsed.error();
            }
            *target = parsed.value();
        }
    }

    struct FractionKey {
        const char* key;
        double* target;
    };
    for (auto [key, target] : {FractionKey{"threshold", &config.threshold},
                               FractionKey{"cutoff", &config.cutoff},
                               FractionKey{"aligner_floor", &config.alignerFloor},
                               FractionKey{"aligner_support", &config.alignerSupport}}) {
        if (auto raw = value(key); !raw.empty()) {
            auto parsed = parseFraction(key, raw);
            if (!parsed) {
                return parsed.error();
            }
            *target = parsed.value();
        }
    }

    if (auto raw = value("deadline_ms"); !raw.empty()) {
        auto ms = parse_ms(raw);
        if (!ms) {
            return invalid("deadline_ms", raw);
        }
        config.deadline = *ms;
    }

    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    spdlog::debug("Loaded matching config from {}", path.string());
    return config;
}

} // namespace namesake::config
