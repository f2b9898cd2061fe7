#pragma once

#include "graph/graph_node.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lodbook {

/**
 * @brief Serializes compiled graphs for publication
 */
class GraphCodec {
public:
    virtual ~GraphCodec() = default;

    virtual nlohmann::json encode(const GraphNode& graph) const = 0;
    virtual std::string serialize(const GraphNode& graph) const = 0;
    virtual std::string media_type() const = 0;
};

/**
 * @brief JSON-LD output: {"@context": <context>, "@graph": <graph>}
 *
 * The graph is written in its pre-compaction form. A null or empty context
 * falls back to "http://schema.org/".
 */
class JsonLdCodec : public GraphCodec {
public:
    explicit JsonLdCodec(const nlohmann::json& context = "http://schema.org/", int indent = 2);

    nlohmann::json encode(const GraphNode& graph) const override;
    std::string serialize(const GraphNode& graph) const override;
    std::string media_type() const override { return "application/ld+json"; }

    /**
     * @brief Serialized form that is safe to place inside a <script> element
     */
    std::string serialize_for_script(const GraphNode& graph) const;

    const nlohmann::json& context() const { return context_; }

private:
    nlohmann::json context_;
    int indent_;
};

} // namespace lodbook
