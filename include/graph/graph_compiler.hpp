#pragma once

#include "core/build_context.hpp"
#include "graph/graph_node.hpp"
#include "record/record.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lodbook {

/**
 * @brief Normalizes record property trees into graph nodes
 *
 * Hydration rules, applied recursively to every property:
 * - `type` scalars resolve through the TypeRegistry (unknown tags pass
 *   through unchanged and are reported)
 * - `id` scalars become "@id"
 * - `name` scalars below the top level are references: the named record is
 *   looked up and the enclosing object receives its "@id", "@type" and, for
 *   image types, its "image". Keys the enclosing object already carries
 *   are never overwritten. An unknown name keeps only "name" and is reported.
 * - mappings are hydrated key by key under their parent key
 * - lists hydrate each element as a single-property object, then drop the
 *   per-element key. An element that hydrates to one value becomes that
 *   value; an element that hydrates to several values (a `name` element
 *   resolved into name, id and type) becomes the list of those values.
 *
 * Hydration is a pure function of the record store, type registry and
 * site URLs, so the same record always yields the same node within a build.
 */
class GraphCompiler {
public:
    explicit GraphCompiler(const BuildContext& context);

    /**
     * @brief Hydrate a record into a graph node
     */
    GraphNode hydrate(const Record& record) const;

    /**
     * @brief Hydrate the record with this exact name, if there is one
     */
    std::optional<GraphNode> hydrate(const std::string& name) const;

    /**
     * @brief Hydrate a record as the main entity of its own page
     *
     * Adds "mainEntityOfPage" pointing at the entity's HTML page.
     */
    GraphNode compile_entity(const Record& record) const;

    /**
     * @brief Identifier of a record: its explicit id, else its entity URI
     */
    std::string entity_id(const Record& record) const;

    /**
     * @brief Link object for a name reference: {name, @id, @type, image?}
     */
    nlohmann::json hydrate_link(const std::string& name) const;

private:
    // Ordered (key, value) pairs; order matters when list elements collapse
    using Entries = std::vector<std::pair<std::string, nlohmann::json>>;

    const BuildContext& context_;

    Entries extract_properties(const PropertyMap* enclosing,
                               const std::string& key,
                               const PropertyValue& value) const;
    Entries process_value(const PropertyMap* enclosing,
                          const std::string& key,
                          const PropertyValue& value) const;
    Entries process_mapping(const std::string& key, const PropertyValue& value) const;
    Entries process_list(const std::string& key, const PropertyValue& value) const;

    Entries link_entries(const PropertyMap* enclosing, const std::string& name) const;
    std::string resolve_type(const std::string& tag) const;

    static nlohmann::json collapse_element(const Entries& element);
    static nlohmann::json to_object(const Entries& entries);
};

} // namespace lodbook
