#include "graph/graph_compiler.hpp"
#include <algorithm>

namespace lodbook {

namespace {

bool has_explicit_id(const PropertyMap* enclosing) {
    if (!enclosing) return false;
    for (const auto& entry : *enclosing) {
        if (entry.first == "id" || entry.first == "@id") return true;
    }
    return false;
}

bool contains_key(const std::vector<std::pair<std::string, nlohmann::json>>& entries,
                  const std::string& key) {
    return std::any_of(entries.begin(), entries.end(),
                       [&key](const auto& e) { return e.first == key; });
}

}  // namespace

GraphCompiler::GraphCompiler(const BuildContext& context) : context_(context) {}

GraphNode GraphCompiler::hydrate(const Record& record) const {
    GraphNode node;
    node.name = record.name;
    node.type = resolve_type(record.type);
    node.id = entity_id(record);

    // Name, type and id are held apart from the properties, so no
    // top-level key is ever looked up as a reference
    for (const auto& [key, value] : record.properties) {
        for (auto& [k, v] : extract_properties(nullptr, key, value)) {
            node.properties[k] = std::move(v);
        }
    }

    return node;
}

std::optional<GraphNode> GraphCompiler::hydrate(const std::string& name) const {
    const Record* record = context_.store.find(name);
    if (!record) {
        context_.advisories.report(AdvisoryKind::UNRESOLVED_REFERENCE, name, "no record with this name");
        return std::nullopt;
    }
    return hydrate(*record);
}

GraphNode GraphCompiler::compile_entity(const Record& record) const {
    GraphNode node = hydrate(record);
    std::string collection = context_.types.collection(record.type);
    node.properties["mainEntityOfPage"] = context_.entity_uri(collection, record.name) + "index.html";
    return node;
}

std::string GraphCompiler::entity_id(const Record& record) const {
    if (record.has_explicit_id()) {
        return record.id;
    }
    return context_.entity_uri(context_.types.collection(record.type), record.name);
}

nlohmann::json GraphCompiler::hydrate_link(const std::string& name) const {
    return to_object(link_entries(nullptr, name));
}

GraphCompiler::Entries GraphCompiler::extract_properties(const PropertyMap* enclosing,
                                                         const std::string& key,
                                                         const PropertyValue& value) const {
    if (value.is_mapping()) {
        return process_mapping(key, value);
    }
    if (value.is_list()) {
        return process_list(key, value);
    }
    return process_value(enclosing, key, value);
}

GraphCompiler::Entries GraphCompiler::process_value(const PropertyMap* enclosing,
                                                    const std::string& key,
                                                    const PropertyValue& value) const {
    if (key == "name") {
        return link_entries(enclosing, value.scalar_text());
    }
    if (key == "type") {
        return {{"@type", resolve_type(value.scalar_text())}};
    }
    if (key == "id") {
        return {{"@id", value.as_scalar()}};
    }
    return {{key, value.as_scalar()}};
}

GraphCompiler::Entries GraphCompiler::process_mapping(const std::string& key,
                                                      const PropertyValue& value) const {
    const PropertyMap& children = value.entries();

    // Explicit keys first, so the link synthesized from `name` only fills gaps
    Entries properties;
    for (const auto& [k, v] : children) {
        if (k == "name" && v.is_scalar()) continue;
        for (auto& entry : extract_properties(&children, k, v)) {
            auto it = std::find_if(properties.begin(), properties.end(),
                                   [&entry](const auto& e) { return e.first == entry.first; });
            if (it != properties.end()) {
                it->second = std::move(entry.second);
            } else {
                properties.push_back(std::move(entry));
            }
        }
    }

    const PropertyValue* name = value.get("name");
    if (name && name->is_scalar()) {
        Entries link = link_entries(&children, name->scalar_text());
        Entries merged;
        for (auto& entry : link) {
            if (!contains_key(properties, entry.first)) {
                merged.push_back(std::move(entry));
            }
        }
        merged.insert(merged.end(),
                      std::make_move_iterator(properties.begin()),
                      std::make_move_iterator(properties.end()));
        properties = std::move(merged);
    }

    return {{key, to_object(properties)}};
}

GraphCompiler::Entries GraphCompiler::process_list(const std::string& key,
                                                   const PropertyValue& value) const {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& item : value.items()) {
        values.push_back(collapse_element(extract_properties(nullptr, key, item)));
    }
    return {{key, values}};
}

GraphCompiler::Entries GraphCompiler::link_entries(const PropertyMap* enclosing,
                                                   const std::string& name) const {
    Entries link;
    link.emplace_back("name", name);

    const Record* record = context_.store.find(name);
    if (!record) {
        context_.advisories.report(AdvisoryKind::UNRESOLVED_REFERENCE, name,
                                   "referenced name matches no record");
        return link;
    }

    if (!has_explicit_id(enclosing)) {
        link.emplace_back("@id", entity_id(*record));
    }

    std::string type = resolve_type(record->type);
    link.emplace_back("@type", type);

    const PropertyValue* image = record->property("image");
    if (image && type.find("ImageObject") != std::string::npos) {
        link.emplace_back("image", image->to_json());
    }

    return link;
}

std::string GraphCompiler::resolve_type(const std::string& tag) const {
    if (tag.empty()) {
        return tag;
    }
    if (!context_.types.has(tag)) {
        context_.advisories.report(AdvisoryKind::UNCONFIGURED_TYPE, tag,
                                   "type has no data_types entry, passing it through");
        return tag;
    }
    return context_.types.graph_type(tag);
}

nlohmann::json GraphCompiler::collapse_element(const Entries& element) {
    if (element.size() == 1) {
        return element.front().second;
    }
    nlohmann::json values = nlohmann::json::array();
    for (const auto& entry : element) {
        values.push_back(entry.second);
    }
    return values;
}

nlohmann::json GraphCompiler::to_object(const Entries& entries) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
        j[key] = value;
    }
    return j;
}

} // namespace lodbook
