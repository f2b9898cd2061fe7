#include "linking/document_processor.hpp"
#include "graph/graph_compiler.hpp"
#include "linking/label_markup.hpp"
#include "render/marker_renderer.hpp"

namespace lodbook {

// ==========================================
// CollectionStyle / DocumentReport
// ==========================================

nlohmann::json CollectionStyle::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["color"] = color;
    return j;
}

CollectionStyle CollectionStyle::from_json(const nlohmann::json& j) {
    CollectionStyle style;
    style.name = j.value("name", "");
    style.color = j.value("color", "");
    return style;
}

nlohmann::json DocumentReport::to_json() const {
    nlohmann::json j;
    j["url"] = url;
    j["references"] = references;
    j["links_added"] = links_added;
    j["entities"] = entities;
    return j;
}

// ==========================================
// DocumentProcessor Implementation
// ==========================================

DocumentProcessor::DocumentProcessor(const BuildContext& context,
                                     const JsonLdCodec& codec,
                                     const std::vector<CollectionStyle>& styles)
    : context_(context), codec_(codec), styles_(styles) {}

NarrativeDocument DocumentProcessor::load(const DocumentInfo& info,
                                          const std::string& source,
                                          const std::string& container_id) const {
    MarkerRenderer markers(context_);
    std::string subject = info.source_path.empty() ? info.url : info.source_path;
    return NarrativeDocument::parse(info, markers.render(source, subject), container_id);
}

DocumentReport DocumentProcessor::process(NarrativeDocument& document) const {
    DocumentReport report;
    report.url = document.info().url;

    document.number_blocks();

    ReferenceIndex index = ReferenceIndex::collect(document);
    report.references = index.size();

    LabelMarkupEngine engine(index);
    report.links_added = engine.markup(document);

    document.set_graph(build_graph(document, index));
    report.entities = document.graph().properties.at("mentions").size();

    embed_graph(document);
    add_styles(document);

    return report;
}

GraphNode DocumentProcessor::build_graph(const NarrativeDocument& document,
                                         const ReferenceIndex& index) const {
    const DocumentInfo& info = document.info();

    GraphNode graph;
    graph.id = context_.page_uri(info.url);
    graph.type = "WebPage";
    graph.name = "Chapter " + info.chapter + ": " + info.title;

    GraphCompiler compiler(context_);
    nlohmann::json mentions = nlohmann::json::array();
    for (const auto& name : index.entity_names()) {
        auto entity = compiler.hydrate(name);
        if (entity) {
            mentions.push_back(entity->to_json());
        }
    }
    graph.properties["mentions"] = mentions;

    return graph;
}

void DocumentProcessor::embed_graph(NarrativeDocument& document) const {
    HtmlNode* body = document.html().find_first("body");
    if (!body) {
        body = &document.html().root();
    }

    auto script = HtmlNode::make_element("script", {
        {"id", "page-data"},
        {"type", codec_.media_type()}
    });
    script->append_child(HtmlNode::make_text(codec_.serialize_for_script(document.graph())));
    body->append_child(std::move(script));
}

void DocumentProcessor::add_styles(NarrativeDocument& document) const {
    if (styles_.empty()) {
        return;
    }
    HtmlNode* head = document.html().find_first("head");
    if (!head) {
        return;
    }

    auto style = HtmlNode::make_element("style", {{"type", "text/css"}});
    style->append_child(HtmlNode::make_text(styles_css()));
    head->append_child(std::move(style));
}

std::string DocumentProcessor::styles_css() const {
    std::string css;
    for (const auto& style : styles_) {
        css += "." + style.name + " { background-color: " + style.color +
               "; border-color: " + style.color + "}\n";
        css += "." + style.name + ".inverse { background-color: #ffffff; color: " +
               style.color + "}\n";
    }
    return css;
}

} // namespace lodbook
