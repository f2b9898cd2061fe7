#ifndef LODBOOK_GRAPH_NODE_HPP
#define LODBOOK_GRAPH_NODE_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace lodbook {

/**
 * @brief Normalized linked-data representation of a record or document
 *
 * `properties` holds every normalized property other than the identifier,
 * type and name, already in graph form (hydrated links, "@id"/"@type" keys).
 */
struct GraphNode {
    std::string id;                                     // "@id" (URI)
    std::string type;                                   // "@type"
    std::string name;
    nlohmann::json properties = nlohmann::json::object();

    bool has_property(const std::string& key) const { return properties.contains(key); }

    /**
     * @brief Pre-compaction graph object: {"@id", "@type", "name", ...properties}
     */
    nlohmann::json to_json() const;

    static GraphNode from_json(const nlohmann::json& j);
};

} // namespace lodbook

#endif // LODBOOK_GRAPH_NODE_HPP
