#pragma once

#include <namesake/compare/value_comparator.h>
#include <namesake/model/schema_catalog.h>

#include <string>
#include <vector>

namespace namesake::features {

/**
 * @brief How aligned value comparisons become one feature value
 */
enum class FeatureMode {
    Similarity,      // aggregate of the aligned pairs
    Disagreement,    // 1 - best pair, only when both sides carry interpretable values
    NumbersMismatch, // share of query numbers absent from the candidate names
};

/**
 * @brief Schema condition under which a feature applies
 */
struct SchemaScope {
    enum class Kind { Any, EitherIs, NeitherIs, BothAre };

    Kind kind = Kind::Any;
    std::string schema;

    static SchemaScope any() { return {}; }
    static SchemaScope eitherIs(std::string schema) { return {Kind::EitherIs, std::move(schema)}; }
    static SchemaScope neitherIs(std::string schema) { return {Kind::NeitherIs, std::move(schema)}; }
    static SchemaScope bothAre(std::string schema) { return {Kind::BothAre, std::move(schema)}; }
};

/**
 * @brief Declarative description of one feature an algorithm consumes
 *
 * An empty property list selects every property of `type` on the schema that
 * the algorithm considers. `candidateProperties`, when set, selects a
 * different property list on the candidate side.
 */
struct FeatureDefinition {
    std::string name;
    model::PropertyType type = model::PropertyType::Name;
    std::vector<std::string> properties;
    std::vector<std::string> candidateProperties;
    FeatureMode mode = FeatureMode::Similarity;
    SchemaScope scope;
    compare::CompareOptions options;
};

} // namespace namesake::features
