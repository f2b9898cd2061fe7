#pragma once

#include "html/html_document.hpp"
#include "graph/graph_node.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief Front matter of a narrative document
 */
struct DocumentInfo {
    std::string title;
    std::string chapter;
    std::string url;            ///< Site-relative URL, e.g. "/chapters/one/"
    std::string source_path;    ///< File the rendered HTML came from (may be empty)

    nlohmann::json to_json() const;
    static DocumentInfo from_json(const nlohmann::json& j);
};

/**
 * @brief A rendered narrative page and the graph compiled from it
 *
 * The narrative lives in the element whose id is `container_id`; its
 * `<p>` descendants are the text blocks every linking pass walks. When the
 * container is missing, the `<p>` elements of `<body>` are used.
 */
class NarrativeDocument {
public:
    NarrativeDocument(DocumentInfo info, HtmlDocument html, const std::string& container_id = "text");

    /**
     * @brief Parse rendered HTML into a document
     */
    static NarrativeDocument parse(const DocumentInfo& info,
                                   const std::string& html,
                                   const std::string& container_id = "text");

    const DocumentInfo& info() const { return info_; }
    HtmlDocument& html() { return html_; }
    const HtmlDocument& html() const { return html_; }

    /**
     * @brief Text blocks in document order
     */
    std::vector<HtmlNode*> text_blocks();
    std::vector<const HtmlNode*> text_blocks() const;

    /**
     * @brief Give text blocks ids "para-<n>" and blockquotes ids "quote-<n>"
     */
    void number_blocks();

    /**
     * @brief Graph of this page; filled in by the DocumentProcessor
     */
    const GraphNode& graph() const { return graph_; }
    void set_graph(GraphNode graph) { graph_ = std::move(graph); }
    bool has_graph() const { return !graph_.id.empty(); }

    std::string to_html() const { return html_.to_html(); }

private:
    DocumentInfo info_;
    HtmlDocument html_;
    std::string container_id_;
    GraphNode graph_;
};

} // namespace lodbook
