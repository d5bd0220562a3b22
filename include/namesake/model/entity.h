#pragma once

#include <namesake/core/types.h>

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namesake::model {

/**
 * @brief Immutable record of a schema and its multi-valued properties
 *
 * Properties keep the insertion order of the source data. Values are kept as
 * given, duplicates included.
 */
class Entity {
public:
    using Property = std::pair<std::string, PropertyValues>;

    class Builder;

    Entity() = default;
    Entity(EntityId id, std::string schema, std::vector<Property> properties = {});

    const EntityId& id() const { return id_; }
    const std::string& schema() const { return schema_; }
    const std::vector<Property>& properties() const { return properties_; }

    /**
     * @brief Values of one property, or an empty sequence when absent
     */
    const PropertyValues& property(std::string_view name) const;

    /**
     * @brief True when the property exists with at least one non-empty value
     */
    bool has(std::string_view name) const;

    /**
     * @brief Concatenated values of several properties, in the order given
     */
    PropertyValues gather(std::span<const std::string> names) const;
    PropertyValues gather(std::initializer_list<std::string_view> names) const;

    bool empty() const { return properties_.empty(); }

    static Builder builder(std::string schema);

private:
    EntityId id_;
    std::string schema_;
    std::vector<Property> properties_;
};

class Entity::Builder {
public:
    explicit Builder(std::string schema) : schema_(std::move(schema)) {}

    Builder& id(EntityId id) {
        id_ = std::move(id);
        return *this;
    }

    /// Appends values; repeated calls for one property extend it.
    Builder& property(std::string name, PropertyValues values);
    Builder& property(std::string name, std::string value);

    Entity build() &&;
    Entity build() const&;

private:
    EntityId id_;
    std::string schema_;
    std::vector<Property> properties_;
};

/**
 * @brief Query-side preparation, done once per query
 *
 * Appends every ordered combination of firstName, secondName, middleName,
 * fatherName and lastName to the name property, at most kMaxNameCombinations.
 */
Entity prepareQuery(const Entity& query);

inline constexpr size_t kMaxNameCombinations = 100;

} // namespace namesake::model
