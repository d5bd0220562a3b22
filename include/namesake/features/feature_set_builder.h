#pragma once

#include <namesake/align/aligner.h>
#include <namesake/compare/value_comparator.h>
#include <namesake/features/feature_definition.h>
#include <namesake/features/feature_vector.h>
#include <namesake/model/entity.h>
#include <namesake/model/schema_catalog.h>
#include <namesake/scoring/algorithm_id.h>

#include <memory>
#include <span>

namespace namesake::features {

/**
 * @brief Evaluates declared features for one query/candidate pair
 *
 * Every declared feature appears in the output, in declaration order, with a
 * status. Name values are prepared once per property list and the name score
 * matrix is shared by all features over the same lists. The builder holds no
 * mutable state and may be shared across threads.
 */
class FeatureSetBuilder {
public:
    FeatureSetBuilder(std::shared_ptr<const compare::ValueComparator> comparator,
                      align::MultiValueAligner aligner);

    FeatureVector build(const model::Entity& query, const model::Entity& candidate,
                        const model::SchemaCatalog& catalog, scoring::AlgorithmId algorithm,
                        std::span<const FeatureDefinition> definitions) const;

    const compare::ValueComparator& comparator() const { return *comparator_; }
    const align::MultiValueAligner& aligner() const { return aligner_; }

private:
    std::shared_ptr<const compare::ValueComparator> comparator_;
    align::MultiValueAligner aligner_;
};

/**
 * @brief Whether a feature scope admits the schema pair
 */
bool inScope(const SchemaScope& scope, const model::SchemaCatalog& catalog,
             std::string_view querySchema, std::string_view candidateSchema);

} // namespace namesake::features
