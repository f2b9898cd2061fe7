#include "graph/graph_node.hpp"

namespace lodbook {

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j = properties.is_object() ? properties : nlohmann::json::object();
    if (!id.empty()) {
        j["@id"] = id;
    }
    if (!type.empty()) {
        j["@type"] = type;
    }
    j["name"] = name;
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.value("@id", "");
    node.type = j.value("@type", "");
    node.name = j.value("name", "");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "@id" || it.key() == "@type" || it.key() == "name") {
            continue;
        }
        node.properties[it.key()] = it.value();
    }
    return node;
}

} // namespace lodbook
