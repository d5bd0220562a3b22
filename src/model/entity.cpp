#include <namesake/model/entity.h>

#include <algorithm>
#include <array>
#include <unordered_set>

namespace namesake::model {

namespace {
const PropertyValues kEmpty;

void appendValues(std::vector<Entity::Property>& properties, std::string name,
                  PropertyValues values) {
    auto it = std::find_if(properties.begin(), properties.end(),
                           [&](const Entity::Property& p) { return p.first == name; });
    if (it == properties.end()) {
        properties.emplace_back(std::move(name), std::move(values));
        return;
    }
    it->second.insert(it->second.end(), std::make_move_iterator(values.begin()),
                      std::make_move_iterator(values.end()));
}
} // namespace

Entity::Entity(EntityId id, std::string schema, std::vector<Property> properties)
    : id_(std::move(id)), schema_(std::move(schema)) {
    for (auto& [name, values] : properties) {
        appendValues(properties_, std::move(name), std::move(values));
    }
}

const PropertyValues& Entity::property(std::string_view name) const {
    for (const auto& [key, values] : properties_) {
        if (key == name) {
            return values;
        }
    }
    return kEmpty;
}

bool Entity::has(std::string_view name) const {
    const auto& values = property(name);
    return std::any_of(values.begin(), values.end(), [](const auto& v) { return !v.empty(); });
}

PropertyValues Entity::gather(std::span<const std::string> names) const {
    PropertyValues out;
    for (const auto& name : names) {
        const auto& values = property(name);
        out.insert(out.end(), values.begin(), values.end());
    }
    return out;
}

PropertyValues Entity::gather(std::initializer_list<std::string_view> names) const {
    PropertyValues out;
    for (auto name : names) {
        const auto& values = property(name);
        out.insert(out.end(), values.begin(), values.end());
    }
    return out;
}

Entity::Builder Entity::builder(std::string schema) {
    return Builder(std::move(schema));
}

Entity::Builder& Entity::Builder::property(std::string name, PropertyValues values) {
    appendValues(properties_, std::move(name), std::move(values));
    return *this;
}

Entity::Builder& Entity::Builder::property(std::string name, std::string value) {
    return property(std::move(name), PropertyValues{std::move(value)});
}

Entity Entity::Builder::build() && {
    return Entity(std::move(id_), std::move(schema_), std::move(properties_));
}

Entity Entity::Builder::build() const& {
    return Entity(id_, schema_, properties_);
}

Entity prepareQuery(const Entity& query) {
    static const std::array<std::string_view, 5> kNameParts = {"firstName", "secondName",
                                                               "middleName", "fatherName",
                                                               "lastName"};

    std::vector<const PropertyValues*> parts;
    for (auto part : kNameParts) {
        const auto& values = query.property(part);
        if (!values.empty()) {
            parts.push_back(&values);
        }
    }
    if (parts.empty()) {
        return query;
    }

    // Odometer over the non-empty parts, in declaration order
    PropertyValues combined;
    std::unordered_set<std::string> seen;
    std::vector<size_t> cursor(parts.size(), 0);
    while (combined.size() < kMaxNameCombinations) {
        std::string name;
        for (size_t i = 0; i < parts.size(); ++i) {
            const auto& value = (*parts[i])[cursor[i]];
            if (value.empty()) {
                continue;
            }
            if (!name.empty()) {
                name.push_back(' ');
            }
            name += value;
        }
        if (!name.empty() && seen.insert(name).second) {
            combined.push_back(std::move(name));
        }

        size_t pos = parts.size();
        while (pos > 0) {
            --pos;
            if (++cursor[pos] < parts[pos]->size()) {
                break;
            }
            cursor[pos] = 0;
            if (pos == 0) {
                pos = parts.size() + 1;
                break;
            }
        }
        if (pos > parts.size()) {
            break;
        }
    }

    std::vector<Entity::Property> properties = query.properties();
    auto it = std::find_if(properties.begin(), properties.end(),
                           [](const Entity::Property& p) { return p.first == "name"; });
    if (it == properties.end()) {
        properties.emplace_back("name", std::move(combined));
    } else {
        for (auto& name : combined) {
            if (std::find(it->second.begin(), it->second.end(), name) == it->second.end()) {
                it->second.push_back(std::move(name));
            }
        }
    }
    return Entity(query.id(), query.schema(), std::move(properties));
}

} // namespace namesake::model
