#include <namesake/scoring/algorithm.h>

#include <algorithm>

namespace namesake::scoring {

std::span<const features::FeatureDefinition> NameBased::features() {
    static const std::vector<features::FeatureDefinition> definitions = [] {
        features::FeatureDefinition name;
        name.name = "name.match";
        name.type = model::PropertyType::Name;
        name.properties = {"name", "alias", "previousName"};
        name.options.nameBlend.soundex = 0.5;
        name.options.nameBlend.jaroParts = 0.5;
        return std::vector<features::FeatureDefinition>{std::move(name)};
    }();
    return definitions;
}

ScoreOutcome NameBased::score(const features::FeatureVector& vector) const {
    ScoreOutcome outcome;
    const auto* name = vector.find("name.match");
    const bool present = name && name->present();
    outcome.noEvidence = !present;
    outcome.score = present ? std::clamp(name->value, 0.0, 1.0) : 0.0;
    outcome.breakdown.push_back({"name.match", present ? name->value : 0.0, 1.0, outcome.score,
                                 name ? name->status : features::FeatureStatus::Missing});
    return outcome;
}

} // namespace namesake::scoring
