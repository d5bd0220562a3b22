#pragma once

#include <namesake/core/types.h>
#include <namesake/scoring/algorithm_id.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace namesake::model {

/**
 * @brief Value types the comparators understand
 */
enum class PropertyType { Name, Date, Country, Identifier, Text, Gender, Address };

[[nodiscard]] constexpr const char* propertyTypeToString(PropertyType type) noexcept {
    switch (type) {
        case PropertyType::Name:
            return "name";
        case PropertyType::Date:
            return "date";
        case PropertyType::Country:
            return "country";
        case PropertyType::Identifier:
            return "identifier";
        case PropertyType::Text:
            return "text";
        case PropertyType::Gender:
            return "gender";
        case PropertyType::Address:
            return "address";
    }
    return "unknown";
}

std::optional<PropertyType> parsePropertyType(std::string_view name);

/**
 * @brief Catalog-side property declaration
 *
 * `type` is the catalog's type name; it must map onto a PropertyType.
 * An empty `algorithms` list means every algorithm considers the property.
 */
struct PropertyDef {
    std::string name;
    std::string type;
    std::vector<std::string> algorithms;
};

struct SchemaDef {
    std::string name;
    std::vector<std::string> extends;
    bool matchable = true;
    std::vector<PropertyDef> properties;
};

/**
 * @brief Property after validation
 */
struct ResolvedProperty {
    std::string name;
    PropertyType type;
    std::vector<scoring::AlgorithmId> algorithms; // empty = all

    bool consideredBy(scoring::AlgorithmId id) const;
};

/**
 * @brief Immutable, versioned schema snapshot
 *
 * Built and validated once; read concurrently by every match computation.
 */
class SchemaCatalog {
public:
    /**
     * @brief Validate and resolve a catalog
     *
     * Fails with UnsupportedProperty when a property type has no comparator,
     * with UnknownSchema when a parent is missing, and with
     * InvalidConfiguration on inheritance cycles or unknown algorithm names.
     */
    static Result<std::shared_ptr<const SchemaCatalog>> create(std::string version,
                                                               std::vector<SchemaDef> schemas);

    /**
     * @brief Built-in subset of the FollowTheMoney model
     */
    static std::shared_ptr<const SchemaCatalog> builtin();

    static std::vector<SchemaDef> builtinDefinitions();

    const std::string& version() const { return version_; }

    bool contains(std::string_view schema) const;
    bool isMatchable(std::string_view schema) const;

    /**
     * @brief True when `schema` is `ancestor` or inherits from it
     */
    bool isA(std::string_view schema, std::string_view ancestor) const;

    /**
     * @brief Query and candidate schemas belong to one line of descent
     */
    bool compatible(std::string_view query, std::string_view candidate) const;

    /**
     * @brief Property visible on the schema through its inheritance chain
     */
    const ResolvedProperty* property(std::string_view schema, std::string_view name) const;

    /**
     * @brief Names of the schema's properties of one type that the algorithm considers
     */
    std::vector<std::string> propertiesOfType(std::string_view schema, PropertyType type,
                                              scoring::AlgorithmId algorithm) const;

    std::vector<std::string> schemaNames() const;

private:
    struct Node {
        std::string name;
        bool matchable = true;
        std::vector<std::string> chain; // self first, then ancestors depth-first
        std::vector<ResolvedProperty> properties; // own and inherited
    };

    SchemaCatalog() = default;

    const Node* find(std::string_view schema) const;

    std::string version_;
    std::unordered_map<std::string, Node> nodes_;
};

/**
 * @brief Holder for the current catalog snapshot
 *
 * Refresh swaps the whole snapshot. Readers pin one snapshot for the duration
 * of a computation and never observe a partial update.
 */
class CatalogHandle {
public:
    explicit CatalogHandle(std::shared_ptr<const SchemaCatalog> catalog);

    std::shared_ptr<const SchemaCatalog> snapshot() const;

    Result<void> swap(std::shared_ptr<const SchemaCatalog> catalog);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SchemaCatalog> current_;
};

} // namespace namesake::model
