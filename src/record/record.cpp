#include "record/record.hpp"
#include <stdexcept>

namespace lodbook {

// ==========================================
// PropertyValue Implementation
// ==========================================

PropertyValue::PropertyValue() : kind_(Kind::SCALAR), scalar_(nullptr) {}

PropertyValue PropertyValue::scalar(const nlohmann::json& value) {
    PropertyValue v;
    v.kind_ = Kind::SCALAR;
    v.scalar_ = value;
    return v;
}

PropertyValue PropertyValue::mapping(PropertyMap entries) {
    PropertyValue v;
    v.entries_ = std::move(entries);
    v.kind_ = Kind::OBJECT;
    for (const auto& entry : v.entries_) {
        if (entry.first == "name") {
            v.kind_ = Kind::REFERENCE;
            break;
        }
    }
    return v;
}

PropertyValue PropertyValue::list(PropertyList items) {
    PropertyValue v;
    v.kind_ = Kind::LIST;
    v.items_ = std::move(items);
    return v;
}

PropertyValue PropertyValue::from_json(const nlohmann::json& j) {
    if (j.is_object()) {
        PropertyMap entries;
        for (auto it = j.begin(); it != j.end(); ++it) {
            entries.emplace_back(it.key(), from_json(it.value()));
        }
        return mapping(std::move(entries));
    }
    if (j.is_array()) {
        PropertyList items;
        items.reserve(j.size());
        for (const auto& item : j) {
            items.push_back(from_json(item));
        }
        return list(std::move(items));
    }
    return scalar(j);
}

nlohmann::json PropertyValue::to_json() const {
    switch (kind_) {
        case Kind::SCALAR:
            return scalar_;
        case Kind::REFERENCE:
        case Kind::OBJECT: {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& entry : entries_) {
                j[entry.first] = entry.second.to_json();
            }
            return j;
        }
        case Kind::LIST: {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& item : items_) {
                j.push_back(item.to_json());
            }
            return j;
        }
    }
    return nullptr;
}

const nlohmann::json& PropertyValue::as_scalar() const {
    if (kind_ != Kind::SCALAR) {
        throw std::logic_error("Property value is not a scalar");
    }
    return scalar_;
}

const PropertyMap& PropertyValue::entries() const {
    if (!is_mapping()) {
        throw std::logic_error("Property value is not a mapping");
    }
    return entries_;
}

const PropertyList& PropertyValue::items() const {
    if (kind_ != Kind::LIST) {
        throw std::logic_error("Property value is not a list");
    }
    return items_;
}

std::string PropertyValue::scalar_text() const {
    const auto& value = as_scalar();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

const PropertyValue* PropertyValue::get(const std::string& key) const {
    if (!is_mapping()) return nullptr;
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

// ==========================================
// Record Implementation
// ==========================================

const PropertyValue* Record::property(const std::string& key) const {
    for (const auto& entry : properties) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

Record Record::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        throw std::invalid_argument("Record has no string 'name'");
    }

    Record record;
    record.name = j["name"].get<std::string>();

    if (j.contains("type") && j["type"].is_string()) {
        record.type = j["type"].get<std::string>();
    } else if (j.contains("@type") && j["@type"].is_string()) {
        record.type = j["@type"].get<std::string>();
    }

    if (j.contains("@id") && j["@id"].is_string()) {
        record.id = j["@id"].get<std::string>();
    } else if (j.contains("id") && j["id"].is_string()) {
        record.id = j["id"].get<std::string>();
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "name" || key == "type" || key == "@type" || key == "id" || key == "@id") {
            continue;
        }
        record.properties.emplace_back(key, PropertyValue::from_json(it.value()));
    }

    return record;
}

nlohmann::json Record::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    if (!type.empty()) j["type"] = type;
    if (!id.empty()) j["id"] = id;
    for (const auto& entry : properties) {
        j[entry.first] = entry.second.to_json();
    }
    return j;
}

} // namespace lodbook
