#include <namesake/scoring/algorithm.h>

#include <algorithm>
#include <array>

namespace namesake::scoring {

namespace {

using features::FeatureDefinition;
using model::PropertyType;

FeatureDefinition qualifier(std::string name, PropertyType type,
                            std::vector<std::string> properties) {
    FeatureDefinition def;
    def.name = std::move(name);
    def.type = type;
    def.properties = std::move(properties);
    return def;
}

constexpr std::array<NameQualified::Qualifier, 4> kQualifiers = {{
    {"country.match", 0.05, 0.85, 0.8},
    {"dob.match", 0.10, 0.70, 0.6},
    {"gender.match", 0.02, 0.80, 0.7},
    // Identifiers never penalise: an entity may carry several unrelated numbers
    {"identifier.match", 0.30, 1.0, 1.0},
}};

} // namespace

std::span<const FeatureDefinition> NameQualified::features() {
    static const std::vector<FeatureDefinition> definitions = [] {
        std::vector<FeatureDefinition> defs(NameBased::features().begin(),
                                            NameBased::features().end());
        defs.push_back(qualifier("country.match", PropertyType::Country, {}));
        defs.push_back(qualifier("dob.match", PropertyType::Date, {"birthDate"}));
        defs.push_back(qualifier("gender.match", PropertyType::Gender, {"gender"}));
        defs.push_back(qualifier("identifier.match", PropertyType::Identifier,
                                 {"registrationNumber", "taxNumber", "leiCode", "innCode",
                                  "ogrnCode", "bicCode", "imoNumber", "mmsi", "isin"}));
        return defs;
    }();
    return definitions;
}

std::span<const NameQualified::Qualifier> NameQualified::qualifiers() {
    return kQualifiers;
}

ScoreOutcome NameQualified::score(const features::FeatureVector& vector) const {
    ScoreOutcome outcome = NameBased{}.score(vector);
    if (outcome.noEvidence) {
        for (const auto& q : kQualifiers) {
            const auto* f = vector.find(q.feature);
            outcome.breakdown.push_back(
                {q.feature, 0.0, 0.0, 0.0, f ? f->status : features::FeatureStatus::Missing});
        }
        return outcome;
    }

    double score = outcome.score;
    std::vector<FeatureContribution> lines;
    for (const auto& q : kQualifiers) {
        const auto* f = vector.find(q.feature);
        FeatureContribution line{q.feature, 0.0, q.boost, 0.0,
                                 f ? f->status : features::FeatureStatus::Missing};
        if (f && f->present() && f->value > 0.0) {
            line.value = f->value;
            const double before = score;
            score += (1.0 - score) * q.boost * std::clamp(f->value, 0.0, 1.0);
            line.contribution = score - before;
        }
        lines.push_back(line);
    }

    // Disagreement is applied last so that its cap holds whatever the name scored
    for (size_t i = 0; i < kQualifiers.size(); ++i) {
        const auto& q = kQualifiers[i];
        const auto* f = vector.find(q.feature);
        if (f && f->present() && f->value <= 0.0 && q.penalty < 1.0) {
            const double before = score;
            score = std::min(score * q.penalty, q.cap);
            lines[i].weight = q.penalty;
            lines[i].contribution = score - before;
        }
    }

    outcome.score = std::clamp(score, 0.0, 1.0);
    outcome.breakdown.insert(outcome.breakdown.end(), lines.begin(), lines.end());
    return outcome;
}

} // namespace namesake::scoring
