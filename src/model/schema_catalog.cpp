#include <namesake/model/schema_catalog.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

namespace namesake::model {

std::optional<PropertyType> parsePropertyType(std::string_view name) {
    static constexpr PropertyType kTypes[] = {
        PropertyType::Name,   PropertyType::Date,   PropertyType::Country, PropertyType::Identifier,
        PropertyType::Text,   PropertyType::Gender, PropertyType::Address};
    for (auto type : kTypes) {
        if (name == propertyTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

bool ResolvedProperty::consideredBy(scoring::AlgorithmId id) const {
    return algorithms.empty() || std::find(algorithms.begin(), algorithms.end(), id) != algorithms.end();
}

Result<std::shared_ptr<const SchemaCatalog>> SchemaCatalog::create(std::string version,
                                                                   std::vector<SchemaDef> schemas) {
    std::unordered_map<std::string, const SchemaDef*> byName;
    for (const auto& schema : schemas) {
        if (schema.name.empty()) {
            return Error{ErrorCode::InvalidConfiguration, "schema without a name"};
        }
        if (!byName.emplace(schema.name, &schema).second) {
            return Error{ErrorCode::InvalidConfiguration, "duplicate schema '" + schema.name + "'"};
        }
    }

    // Validate property types and parents before resolving anything
    std::unordered_map<std::string, std::vector<ResolvedProperty>> ownProperties;
    for (const auto& schema : schemas) {
        for (const auto& parent : schema.extends) {
            if (!byName.contains(parent)) {
                return Error{ErrorCode::UnknownSchema,
                             "schema '" + schema.name + "' extends unknown '" + parent + "'"};
            }
        }
        auto& resolved = ownProperties[schema.name];
        for (const auto& prop : schema.properties) {
            auto type = parsePropertyType(prop.type);
            if (!type) {
                return Error{ErrorCode::UnsupportedProperty,
                             "no comparator for property " + schema.name + "." + prop.name +
                                 " of type '" + prop.type + "'"};
            }
            ResolvedProperty rp{prop.name, *type, {}};
            for (const auto& algorithm : prop.algorithms) {
                auto id = scoring::parseAlgorithm(algorithm);
                if (!id) {
                    return Error{ErrorCode::InvalidConfiguration,
                                 "property " + schema.name + "." + prop.name + ": " +
                                     id.error().message};
                }
                rp.algorithms.push_back(id.value());
            }
            resolved.push_back(std::move(rp));
        }
    }

    std::shared_ptr<SchemaCatalog> catalog(new SchemaCatalog());
    catalog->version_ = std::move(version);

    for (const auto& schema : schemas) {
        Node node;
        node.name = schema.name;
        node.matchable = schema.matchable;

        // Depth-first walk of the parents; a schema reappearing on the current path is a cycle
        std::vector<std::string> path;
        std::function<bool(const std::string&)> visit = [&](const std::string& name) {
            if (std::find(path.begin(), path.end(), name) != path.end()) {
                return false;
            }
            if (std::find(node.chain.begin(), node.chain.end(), name) != node.chain.end()) {
                return true;
            }
            node.chain.push_back(name);
            path.push_back(name);
            for (const auto& parent : byName.at(name)->extends) {
                if (!visit(parent)) {
                    return false;
                }
            }
            path.pop_back();
            return true;
        };
        if (!visit(schema.name)) {
            return Error{ErrorCode::InvalidConfiguration,
                         "inheritance cycle through schema '" + schema.name + "'"};
        }

        // Nearest definition wins
        for (const auto& name : node.chain) {
            for (const auto& prop : ownProperties[name]) {
                auto exists = std::any_of(node.properties.begin(), node.properties.end(),
                                          [&](const auto& p) { return p.name == prop.name; });
                if (!exists) {
                    node.properties.push_back(prop);
                }
            }
        }
        catalog->nodes_.emplace(schema.name, std::move(node));
    }

    spdlog::debug("Schema catalog {} resolved with {} schemas", catalog->version_,
                  catalog->nodes_.size());
    return std::shared_ptr<const SchemaCatalog>(std::move(catalog));
}

std::shared_ptr<const SchemaCatalog> SchemaCatalog::builtin() {
    static const std::shared_ptr<const SchemaCatalog> instance = [] {
        auto created = create("ftm-builtin-1", builtinDefinitions());
        if (!created) {
            // Built-in definitions are fixed at compile time
            throw std::logic_error("built-in schema catalog is invalid: " +
                                   created.error().message);
        }
        return std::move(created).value();
    }();
    return instance;
}

const SchemaCatalog::Node* SchemaCatalog::find(std::string_view schema) const {
    auto it = nodes_.find(std::string(schema));
    return it == nodes_.end() ? nullptr : &it->second;
}

bool SchemaCatalog::contains(std::string_view schema) const {
    return find(schema) != nullptr;
}

bool SchemaCatalog::isMatchable(std::string_view schema) const {
    const auto* node = find(schema);
    return node && node->matchable;
}

bool SchemaCatalog::isA(std::string_view schema, std::string_view ancestor) const {
    const auto* node = find(schema);
    if (!node) {
        return false;
    }
    return std::find(node->chain.begin(), node->chain.end(), ancestor) != node->chain.end();
}

bool SchemaCatalog::compatible(std::string_view query, std::string_view candidate) const {
    if (!contains(query) || !isMatchable(candidate)) {
        return false;
    }
    return isA(candidate, query) || isA(query, candidate);
}

const ResolvedProperty* SchemaCatalog::property(std::string_view schema,
                                                std::string_view name) const {
    const auto* node = find(schema);
    if (!node) {
        return nullptr;
    }
    for (const auto& prop : node->properties) {
        if (prop.name == name) {
            return &prop;
        }
    }
    return nullptr;
}

std::vector<std::string> SchemaCatalog::propertiesOfType(std::string_view schema,
                                                         PropertyType type,
                                                         scoring::AlgorithmId algorithm) const {
    std::vector<std::string> out;
    const auto* node = find(schema);
    if (!node) {
        return out;
    }
    for (const auto& prop : node->properties) {
        if (prop.type == type && prop.consideredBy(algorithm)) {
            out.push_back(prop.name);
        }
    }
    return out;
}

std::vector<std::string> SchemaCatalog::schemaNames() const {
    std::vector<std::string> names;
    names.reserve(nodes_.size());
    for (const auto& [name, node] : nodes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

CatalogHandle::CatalogHandle(std::shared_ptr<const SchemaCatalog> catalog)
    : current_(std::move(catalog)) {}

std::shared_ptr<const SchemaCatalog> CatalogHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

Result<void> CatalogHandle::swap(std::shared_ptr<const SchemaCatalog> catalog) {
    if (!catalog) {
        return Error{ErrorCode::InvalidArgument, "cannot install an empty catalog"};
    }
    std::shared_ptr<const SchemaCatalog> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(current_, std::move(catalog));
    }
    spdlog::info("Schema catalog swapped: {} -> {}", previous ? previous->version() : "none",
                 snapshot()->version());
    return {};
}

} // namespace namesake::model
