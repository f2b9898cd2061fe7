#include "linking/reference_index.hpp"
#include <algorithm>

namespace lodbook {

nlohmann::json Reference::to_json() const {
    nlohmann::json j;
    j["label"] = label;
    j["name"] = name;
    j["collection"] = collection;
    j["url"] = url;
    return j;
}

ReferenceIndex ReferenceIndex::collect(const NarrativeDocument& document) {
    ReferenceIndex index;
    for (const HtmlNode* block : document.text_blocks()) {
        std::vector<const HtmlNode*> links;
        block->find_all([](const HtmlNode& n) {
            return n.is_element("a") && n.attribute("property") == "name";
        }, links);

        for (const HtmlNode* link : links) {
            Reference ref;
            ref.label = link->text_content();
            ref.name = link->attribute("data-name");
            ref.collection = link->attribute("data-collection");
            ref.url = link->attribute("href");
            index.add(ref);
        }
    }
    return index;
}

void ReferenceIndex::add(const Reference& reference) {
    if (reference.label.empty() || reference.name.empty()) {
        return;
    }

    auto it = by_label_.find(reference.label);
    if (it != by_label_.end()) {
        references_[it->second] = reference;
    } else {
        by_label_[reference.label] = references_.size();
        references_.push_back(reference);
    }

    if (std::find(names_.begin(), names_.end(), reference.name) == names_.end()) {
        names_.push_back(reference.name);
    }
}

const Reference* ReferenceIndex::find(const std::string& label) const {
    auto it = by_label_.find(label);
    if (it == by_label_.end()) {
        return nullptr;
    }
    return &references_[it->second];
}

std::vector<std::string> ReferenceIndex::labels_by_length() const {
    std::vector<std::string> labels;
    labels.reserve(references_.size());
    for (const auto& ref : references_) {
        labels.push_back(ref.label);
    }
    std::sort(labels.begin(), labels.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });
    return labels;
}

std::vector<std::string> ReferenceIndex::entity_names() const {
    return names_;
}

nlohmann::json ReferenceIndex::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ref : references_) {
        arr.push_back(ref.to_json());
    }
    return arr;
}

} // namespace lodbook
