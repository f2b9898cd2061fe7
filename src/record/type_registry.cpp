#include "record/type_registry.hpp"
#include <stdexcept>

namespace lodbook {

nlohmann::json TypeInfo::to_json() const {
    nlohmann::json j;
    j["type"] = graph_type;
    j["collection"] = collection;
    j["template"] = template_name;
    return j;
}

void TypeRegistry::add(const std::string& tag, const TypeInfo& info) {
    types_[tag] = info;
}

bool TypeRegistry::has(const std::string& tag) const {
    return types_.find(tag) != types_.end();
}

std::optional<TypeInfo> TypeRegistry::get(const std::string& tag) const {
    auto it = types_.find(tag);
    if (it == types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string TypeRegistry::graph_type(const std::string& tag) const {
    auto it = types_.find(tag);
    return it != types_.end() ? it->second.graph_type : tag;
}

std::string TypeRegistry::collection(const std::string& tag) const {
    auto it = types_.find(tag);
    return it != types_.end() ? it->second.collection : tag;
}

nlohmann::json TypeRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [tag, info] : types_) {
        j[tag] = info.to_json();
    }
    return j;
}

TypeRegistry TypeRegistry::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("data_types must be an object");
    }

    TypeRegistry registry;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& entry = it.value();
        if (!entry.is_object()) {
            throw std::invalid_argument("data_types." + it.key() + " must be an object");
        }
        TypeInfo info;
        info.graph_type = entry.value("type", it.key());
        info.collection = entry.value("collection", it.key());
        info.template_name = entry.value("template", std::string());
        registry.add(it.key(), info);
    }
    return registry;
}

} // namespace lodbook
