#pragma once

#include <namesake/features/feature_definition.h>
#include <namesake/features/feature_vector.h>
#include <namesake/scoring/algorithm_id.h>

#include <span>
#include <string>
#include <variant>
#include <vector>

namespace namesake::scoring {

/**
 * @brief One line of the explanation attached to a score
 *
 * `contribution` is the change the feature made: a weighted term for linear
 * models, the score delta for multiplicative adjustments.
 */
struct FeatureContribution {
    std::string feature;
    double value = 0.0;
    double weight = 0.0;
    double contribution = 0.0;
    features::FeatureStatus status = features::FeatureStatus::Missing;
};

struct ScoreOutcome {
    double score = 0.0;
    std::vector<FeatureContribution> breakdown;
    // Set when no feature carried evidence
    bool noEvidence = false;
};

/**
 * @brief Score is the aggregate name similarity; no other evidence is used
 */
class NameBased {
public:
    static constexpr AlgorithmId kId = AlgorithmId::NameBased;

    static std::span<const features::FeatureDefinition> features();
    ScoreOutcome score(const features::FeatureVector& vector) const;
};

/**
 * @brief Name similarity adjusted by bounded qualifier evidence
 *
 * Agreement moves the score a fraction of the way towards 1. Provable
 * disagreement scales the score down and caps it. Absent qualifiers are
 * neutral.
 */
class NameQualified {
public:
    static constexpr AlgorithmId kId = AlgorithmId::NameQualified;

    struct Qualifier {
        const char* feature;
        double boost;
        double penalty;
        double cap;
    };

    static std::span<const features::FeatureDefinition> features();
    static std::span<const Qualifier> qualifiers();
    ScoreOutcome score(const features::FeatureVector& vector) const;
};

/**
 * @brief Logistic model over a fixed, versioned weight table
 */
class LogicV1 {
public:
    static constexpr AlgorithmId kId = AlgorithmId::LogicV1;

    struct Weight {
        const char* feature;
        double weight;
    };

    static constexpr double kBias = -3.5;

    static std::span<const features::FeatureDefinition> features();
    static std::span<const Weight> weights();
    ScoreOutcome score(const features::FeatureVector& vector) const;
};

using ScoringAlgorithm = std::variant<NameBased, NameQualified, LogicV1>;

ScoringAlgorithm makeAlgorithm(AlgorithmId id);

AlgorithmId algorithmId(const ScoringAlgorithm& algorithm);

std::span<const features::FeatureDefinition> declaredFeatures(const ScoringAlgorithm& algorithm);

ScoreOutcome score(const ScoringAlgorithm& algorithm, const features::FeatureVector& vector);

} // namespace namesake::scoring
