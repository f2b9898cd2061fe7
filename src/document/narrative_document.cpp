#include "document/narrative_document.hpp"

namespace lodbook {

// ==========================================
// DocumentInfo Implementation
// ==========================================

nlohmann::json DocumentInfo::to_json() const {
    nlohmann::json j;
    j["title"] = title;
    j["chapter"] = chapter;
    j["url"] = url;
    if (!source_path.empty()) {
        j["path"] = source_path;
    }
    return j;
}

DocumentInfo DocumentInfo::from_json(const nlohmann::json& j) {
    DocumentInfo info;
    info.title = j.value("title", "");
    if (j.contains("chapter")) {
        // Chapters are often written as bare numbers
        info.chapter = j["chapter"].is_string() ? j["chapter"].get<std::string>() : j["chapter"].dump();
    }
    info.url = j.value("url", "");
    info.source_path = j.value("path", "");
    return info;
}

// ==========================================
// NarrativeDocument Implementation
// ==========================================

NarrativeDocument::NarrativeDocument(DocumentInfo info, HtmlDocument html, const std::string& container_id)
    : info_(std::move(info)), html_(std::move(html)), container_id_(container_id) {}

NarrativeDocument NarrativeDocument::parse(const DocumentInfo& info,
                                           const std::string& html,
                                           const std::string& container_id) {
    return NarrativeDocument(info, HtmlDocument::parse(html), container_id);
}

std::vector<HtmlNode*> NarrativeDocument::text_blocks() {
    HtmlNode* scope = html_.find_by_id(container_id_);
    if (!scope) {
        scope = html_.find_first("body");
    }
    if (!scope) {
        return {};
    }
    return find_elements(*scope, "p");
}

std::vector<const HtmlNode*> NarrativeDocument::text_blocks() const {
    const HtmlNode* scope = html_.find_by_id(container_id_);
    if (!scope) {
        auto bodies = find_elements(html_.root(), "body");
        scope = bodies.empty() ? nullptr : bodies.front();
    }
    if (!scope) {
        return {};
    }
    return find_elements(*scope, "p");
}

void NarrativeDocument::number_blocks() {
    auto blocks = text_blocks();
    for (size_t i = 0; i < blocks.size(); ++i) {
        blocks[i]->set_attribute("id", "para-" + std::to_string(i));
    }

    auto quotes = find_elements(html_.root(), "blockquote");
    for (size_t i = 0; i < quotes.size(); ++i) {
        quotes[i]->set_attribute("id", "quote-" + std::to_string(i));
    }
}

} // namespace lodbook
