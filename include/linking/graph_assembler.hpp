#pragma once

#include "graph/graph_node.hpp"
#include "document/narrative_document.hpp"
#include "linking/mention_extractor.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief A document's identity inside the graph of an entity it mentions
 */
struct MentionedBy {
    std::string id;
    std::string name;
    std::string type = "WebPage";

    nlohmann::json to_json() const;
};

/**
 * @brief Everything published for one entity
 *
 * `contexts` is page display data and stays outside the graph.
 */
struct EntityPage {
    std::string title;
    std::string collection;
    std::string template_name;
    std::string url;                        // Site-relative page URL
    GraphNode graph;
    std::vector<Mention> contexts;
    std::optional<std::string> image_file;
    bool assembled = false;

    nlohmann::json to_json() const;
};

/**
 * @brief Folds back-references and mention contexts into entity pages
 *
 * Runs in the second build phase, after every document has been linked and
 * has its graph.
 */
class GraphAssembler {
public:
    explicit GraphAssembler(size_t context_words = 5);

    /**
     * @brief Merge the documents that mention an entity into its page
     *
     * Appends one mentionedBy entry per mentioning document; the key is left
     * out entirely when there are none. Mentions are appended to the page
     * contexts.
     *
     * @throws std::logic_error if the page was already assembled
     */
    const GraphNode& assemble(EntityPage& page,
                              const std::vector<const NarrativeDocument*>& mentioning,
                              const std::vector<Mention>& mentions) const;

    /**
     * @brief Find the documents mentioning the page's entity and assemble it
     *
     * Mentions are extracted from each mentioning document in document order.
     */
    const GraphNode& enrich(EntityPage& page, const std::vector<NarrativeDocument>& documents) const;

    /**
     * @brief Whether a document graph lists the entity among its mentions
     */
    static bool mentions_entity(const GraphNode& document_graph, const std::string& entity_id);

private:
    MentionExtractor extractor_;
};

} // namespace lodbook
