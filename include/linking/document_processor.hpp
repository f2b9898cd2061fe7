#pragma once

#include "core/build_context.hpp"
#include "codec/jsonld_codec.hpp"
#include "document/narrative_document.hpp"
#include "linking/reference_index.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief Display colour of one entity collection
 */
struct CollectionStyle {
    std::string name;
    std::string color;

    nlohmann::json to_json() const;
    static CollectionStyle from_json(const nlohmann::json& j);
};

/**
 * @brief What one document pass found
 */
struct DocumentReport {
    std::string url;
    size_t references = 0;          // Labels established by explicit markers
    size_t links_added = 0;         // Occurrences linked by label markup
    size_t entities = 0;            // Entities in the document graph

    nlohmann::json to_json() const;
};

/**
 * @brief First build phase for one narrative document
 *
 * Steps, in order:
 * 1. Number text blocks and blockquotes
 * 2. Collect the references set by explicit markers
 * 3. Link further occurrences of every label
 * 4. Compile the document graph with the hydrated graph of every entity
 *    the document references
 * 5. Embed the encoded graph as <script id="page-data"> in <body>, and the
 *    collection styles as <style> in <head>
 */
class DocumentProcessor {
public:
    DocumentProcessor(const BuildContext& context,
                      const JsonLdCodec& codec,
                      const std::vector<CollectionStyle>& styles = {});

    /**
     * @brief Render the markers of a chapter source and parse the result
     */
    NarrativeDocument load(const DocumentInfo& info,
                           const std::string& source,
                           const std::string& container_id = "text") const;

    DocumentReport process(NarrativeDocument& document) const;

    /**
     * @brief {"@id", "name": "Chapter <n>: <title>", "@type": "WebPage", "mentions"}
     */
    GraphNode build_graph(const NarrativeDocument& document, const ReferenceIndex& index) const;

    void embed_graph(NarrativeDocument& document) const;
    void add_styles(NarrativeDocument& document) const;

    /**
     * @brief CSS rules for the collection styles
     */
    std::string styles_css() const;

private:
    const BuildContext& context_;
    const JsonLdCodec& codec_;
    std::vector<CollectionStyle> styles_;
};

} // namespace lodbook
