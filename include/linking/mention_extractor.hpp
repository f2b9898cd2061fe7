#pragma once

#include "document/narrative_document.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief One linked occurrence of an entity inside a document
 */
struct Mention {
    std::string document_title;
    std::string document_chapter;
    std::string document_url;
    std::string paragraph_id;       // "3" for the block with id "para-3"
    std::string context;            // "<before> <em>label</em> <after>"

    nlohmann::json to_json() const;
    static Mention from_json(const nlohmann::json& j);
};

/**
 * @brief Finds the links to one entity in a document and quotes each in context
 *
 * Occurrences come out in block order, then left to right within a block.
 * Each context holds up to `context_words` words before and after the link
 * (fewer at block edges), tags stripped, with the link text in <em>.
 */
class MentionExtractor {
public:
    explicit MentionExtractor(size_t context_words = 5);

    std::vector<Mention> extract(const NarrativeDocument& document, const std::string& entity_name) const;

    /**
     * @brief Context strings for every link to `entity_name` in one block
     */
    std::vector<std::string> contexts_in_block(const HtmlNode& block, const std::string& entity_name) const;

    size_t context_words() const { return context_words_; }

private:
    size_t context_words_;
};

/**
 * @brief Number part of a block id ("para-3" -> "3"), empty if none
 */
std::string paragraph_number(const HtmlNode& block);

} // namespace lodbook
