#include <namesake/features/feature_set_builder.h>
#include <namesake/normalize/text_utils.h>

#include <algorithm>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace namesake::features {

namespace {

using model::PropertyType;

using ScoreMatrix = std::vector<std::vector<double>>;
using NameMatrix = std::vector<std::vector<compare::NameScores>>;

PropertyValues nonBlank(PropertyValues values) {
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](const std::string& v) {
                                    return v.find_first_not_of(" \t\r\n") == std::string::npos;
                                }),
                 values.end());
    return values;
}

std::vector<std::string> resolveProperties(const model::SchemaCatalog& catalog,
                                           std::string_view schema, PropertyType type,
                                           const std::vector<std::string>& requested,
                                           scoring::AlgorithmId algorithm) {
    if (requested.empty()) {
        return catalog.propertiesOfType(schema, type, algorithm);
    }
    std::vector<std::string> out;
    for (const auto& name : requested) {
        const auto* prop = catalog.property(schema, name);
        if (prop && prop->consideredBy(algorithm)) {
            out.push_back(name);
        }
    }
    return out;
}

std::string cacheKey(const std::vector<std::string>& names) {
    return normalize::join(names, ",");
}

// Per-build memo of prepared names and name score matrices
class NameCache {
public:
    explicit NameCache(const compare::ValueComparator& comparator) : comparator_(comparator) {}

    const std::vector<compare::PreparedName>& prepared(char side, const std::string& key,
                                                       const PropertyValues& values) {
        auto [it, inserted] = prepared_.try_emplace(side + key);
        if (inserted) {
            it->second.reserve(values.size());
            for (const auto& v : values) {
                it->second.push_back(comparator_.prepareName(v));
            }
        }
        return it->second;
    }

    const NameMatrix& matrix(const std::string& queryKey, const PropertyValues& queryValues,
                             const std::string& candidateKey,
                             const PropertyValues& candidateValues) {
        auto [it, inserted] = matrices_.try_emplace(queryKey + "|" + candidateKey);
        if (inserted) {
            const auto& q = prepared('q', queryKey, queryValues);
            const auto& c = prepared('c', candidateKey, candidateValues);
            it->second.assign(q.size(), std::vector<compare::NameScores>(c.size()));
            for (size_t i = 0; i < q.size(); ++i) {
                for (size_t j = 0; j < c.size(); ++j) {
                    it->second[i][j] = comparator_.compareNames(q[i], c[j]);
                }
            }
        }
        return it->second;
    }

private:
    const compare::ValueComparator& comparator_;
    std::map<std::string, std::vector<compare::PreparedName>> prepared_;
    std::map<std::string, NameMatrix> matrices_;
};

std::set<std::string> numbersOf(const PropertyValues& values) {
    std::set<std::string> out;
    for (const auto& v : values) {
        for (auto& n : normalize::extractNumbers(v)) {
            out.insert(std::move(n));
        }
    }
    return out;
}

} // namespace

bool inScope(const SchemaScope& scope, const model::SchemaCatalog& catalog,
             std::string_view querySchema, std::string_view candidateSchema) {
    const bool q = !scope.schema.empty() && catalog.isA(querySchema, scope.schema);
    const bool c = !scope.schema.empty() && catalog.isA(candidateSchema, scope.schema);
    switch (scope.kind) {
        case SchemaScope::Kind::Any:
            return true;
        case SchemaScope::Kind::EitherIs:
            return q || c;
        case SchemaScope::Kind::NeitherIs:
            return !q && !c;
        case SchemaScope::Kind::BothAre:
            return q && c;
    }
    return false;
}

FeatureSetBuilder::FeatureSetBuilder(std::shared_ptr<const compare::ValueComparator> comparator,
                                     align::MultiValueAligner aligner)
    : comparator_(std::move(comparator)), aligner_(std::move(aligner)) {}

FeatureVector FeatureSetBuilder::build(const model::Entity& query,
                                       const model::Entity& candidate,
                                       const model::SchemaCatalog& catalog,
                                       scoring::AlgorithmId algorithm,
                                       std::span<const FeatureDefinition> definitions) const {
    FeatureVector vector;
    NameCache names(*comparator_);

    // Properties resolve on the more specific schema so that a general query
    // still sees the candidate's specialised properties
    const std::string& schema =
        catalog.isA(candidate.schema(), query.schema()) ? candidate.schema() : query.schema();

    for (const auto& def : definitions) {
        Feature feature;
        feature.name = def.name;

        if (!inScope(def.scope, catalog, query.schema(), candidate.schema())) {
            vector.add(std::move(feature));
            continue;
        }

        const auto queryProps =
            resolveProperties(catalog, schema, def.type, def.properties, algorithm);
        const auto candidateProps = def.candidateProperties.empty()
                                        ? queryProps
                                        : resolveProperties(catalog, schema, def.type,
                                                            def.candidateProperties, algorithm);
        const auto queryValues = nonBlank(query.gather(queryProps));
        const auto candidateValues = nonBlank(candidate.gather(candidateProps));
        if (queryValues.empty() || candidateValues.empty()) {
            vector.add(std::move(feature));
            continue;
        }

        if (def.mode == FeatureMode::NumbersMismatch) {
            const auto left = numbersOf(queryValues);
            if (!left.empty()) {
                const auto right = numbersOf(candidateValues);
                const size_t base = std::max<size_t>(1, std::min(left.size(), right.size()));
                const auto mismatches = std::count_if(
                    left.begin(), left.end(), [&](const auto& n) { return !right.contains(n); });
                feature.value =
                    std::clamp(static_cast<double>(mismatches) / static_cast<double>(base), 0.0,
                               1.0);
                feature.status = FeatureStatus::Present;
            }
            vector.add(std::move(feature));
            continue;
        }

        ScoreMatrix matrix(queryValues.size(), std::vector<double>(candidateValues.size(), 0.0));
        bool interpreted = false;
        if (def.type == PropertyType::Name) {
            const auto& scores = names.matrix(cacheKey(queryProps), queryValues,
                                              cacheKey(candidateProps), candidateValues);
            for (size_t i = 0; i < scores.size(); ++i) {
                for (size_t j = 0; j < scores[i].size(); ++j) {
                    if (!scores[i][j].ignored) {
                        interpreted = true;
                        matrix[i][j] = def.options.nameBlend.apply(scores[i][j]);
                    }
                }
            }
        } else {
            for (size_t i = 0; i < queryValues.size(); ++i) {
                for (size_t j = 0; j < candidateValues.size(); ++j) {
                    auto cmp = comparator_->compare(def.type, queryValues[i], candidateValues[j],
                                                    def.options);
                    if (!cmp.ignored) {
                        interpreted = true;
                        matrix[i][j] = cmp.similarity;
                    }
                }
            }
        }

        if (!interpreted) {
            feature.status = FeatureStatus::Ignored;
            spdlog::trace("Feature {} ignored for candidate {}: no interpretable values", def.name,
                          candidate.id());
            vector.add(std::move(feature));
            continue;
        }

        const auto alignment = aligner_.align(matrix);
        feature.status = FeatureStatus::Present;
        feature.alignedPairs = alignment.pairs.size();
        feature.value = def.mode == FeatureMode::Disagreement ? 1.0 - alignment.best()
                                                              : alignment.aggregate;
        vector.add(std::move(feature));
    }
    return vector;
}

} // namespace namesake::features
