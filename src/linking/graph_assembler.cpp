#include "linking/graph_assembler.hpp"
#include <stdexcept>

namespace lodbook {

nlohmann::json MentionedBy::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["type"] = type;
    return j;
}

nlohmann::json EntityPage::to_json() const {
    nlohmann::json j;
    j["title"] = title;
    j["collection"] = collection;
    j["template"] = template_name;
    j["url"] = url;
    j["data"] = graph.to_json();

    nlohmann::json contexts_json = nlohmann::json::array();
    for (const auto& mention : contexts) {
        contexts_json.push_back(mention.to_json());
    }
    j["contexts"] = contexts_json;

    if (image_file) {
        j["image_file"] = *image_file;
    }
    return j;
}

GraphAssembler::GraphAssembler(size_t context_words) : extractor_(context_words) {}

const GraphNode& GraphAssembler::assemble(EntityPage& page,
                                          const std::vector<const NarrativeDocument*>& mentioning,
                                          const std::vector<Mention>& mentions) const {
    if (page.assembled) {
        throw std::logic_error("Entity already assembled: " + page.graph.name);
    }
    page.assembled = true;

    if (!mentioning.empty()) {
        nlohmann::json mentioned_by = nlohmann::json::array();
        for (const NarrativeDocument* document : mentioning) {
            MentionedBy entry;
            entry.id = document->graph().id;
            entry.name = document->info().title;
            mentioned_by.push_back(entry.to_json());
        }
        page.graph.properties["mentionedBy"] = mentioned_by;
    }

    page.contexts.insert(page.contexts.end(), mentions.begin(), mentions.end());
    return page.graph;
}

const GraphNode& GraphAssembler::enrich(EntityPage& page,
                                        const std::vector<NarrativeDocument>& documents) const {
    std::vector<const NarrativeDocument*> mentioning;
    std::vector<Mention> mentions;

    for (const auto& document : documents) {
        if (!mentions_entity(document.graph(), page.graph.id)) {
            continue;
        }
        mentioning.push_back(&document);
        auto found = extractor_.extract(document, page.graph.name);
        mentions.insert(mentions.end(), found.begin(), found.end());
    }

    return assemble(page, mentioning, mentions);
}

bool GraphAssembler::mentions_entity(const GraphNode& document_graph, const std::string& entity_id) {
    if (entity_id.empty() || !document_graph.has_property("mentions")) {
        return false;
    }
    for (const auto& mention : document_graph.properties.at("mentions")) {
        if (mention.is_object() && mention.value("@id", "") == entity_id) {
            return true;
        }
    }
    return false;
}

} // namespace lodbook
