#include "linking/mention_extractor.hpp"
#include "text/tokenizer.hpp"
#include <algorithm>
#include <utility>

namespace lodbook {

nlohmann::json Mention::to_json() const {
    nlohmann::json j;
    j["document_title"] = document_title;
    j["document_chapter"] = document_chapter;
    j["document_url"] = document_url;
    j["para"] = paragraph_id;
    j["context"] = context;
    return j;
}

Mention Mention::from_json(const nlohmann::json& j) {
    Mention m;
    m.document_title = j.value("document_title", "");
    m.document_chapter = j.value("document_chapter", "");
    m.document_url = j.value("document_url", "");
    m.paragraph_id = j.value("para", "");
    m.context = j.value("context", "");
    return m;
}

std::string paragraph_number(const HtmlNode& block) {
    std::string id = block.attribute("id");
    size_t dash = id.find('-');
    if (dash == std::string::npos) {
        return "";
    }
    size_t next = id.find('-', dash + 1);
    return id.substr(dash + 1, next == std::string::npos ? std::string::npos : next - dash - 1);
}

MentionExtractor::MentionExtractor(size_t context_words) : context_words_(context_words) {}

std::vector<Mention> MentionExtractor::extract(const NarrativeDocument& document,
                                               const std::string& entity_name) const {
    std::vector<Mention> mentions;
    const DocumentInfo& info = document.info();

    for (const HtmlNode* block : document.text_blocks()) {
        std::string para = paragraph_number(*block);
        for (auto& context : contexts_in_block(*block, entity_name)) {
            Mention m;
            m.document_title = info.title;
            m.document_chapter = info.chapter;
            m.document_url = info.url;
            m.paragraph_id = para;
            m.context = std::move(context);
            mentions.push_back(std::move(m));
        }
    }

    return mentions;
}

std::vector<std::string> MentionExtractor::contexts_in_block(const HtmlNode& block,
                                                             const std::string& entity_name) const {
    std::vector<std::pair<size_t, size_t>> spans;
    std::string html = inner_html(block, [&](const HtmlNode& element, size_t begin, size_t end) {
        if (element.is_element("a") && element.attribute("data-name") == entity_name) {
            spans.emplace_back(begin, end);
        }
    });

    // End tags arrive innermost first; order by position in the block
    std::sort(spans.begin(), spans.end());

    std::vector<std::string> contexts;
    for (const auto& [begin, end] : spans) {
        std::string before = last_words(strip_tags(html.substr(0, begin)), context_words_);
        std::string label = strip_tags(html.substr(begin, end - begin));
        std::string after = first_words(strip_tags(html.substr(end)), context_words_);
        contexts.push_back(trim(before + " <em>" + label + "</em> " + after));
    }
    return contexts;
}

} // namespace lodbook
