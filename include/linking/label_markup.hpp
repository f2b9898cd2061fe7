#pragma once

#include "linking/reference_index.hpp"
#include "document/narrative_document.hpp"
#include "html/html_document.hpp"
#include <memory>
#include <string>

namespace lodbook {

/**
 * @brief Links every further occurrence of each marked label in a document
 *
 * If an explicit marker linked one "James Minahan" in a document, every other
 * whole-word "James Minahan" in that document's text blocks becomes a link to
 * the same entity. Labels are processed longest first, so a shorter label
 * ("James") never fragments a longer one that contains it. Links (existing
 * or new) and `lod-ignore` spans are never entered.
 */
class LabelMarkupEngine {
public:
    explicit LabelMarkupEngine(const ReferenceIndex& index);

    /**
     * @brief Mark up all text blocks of a document
     * @return Number of links added
     */
    size_t markup(NarrativeDocument& document) const;

    /**
     * @brief Mark up one label inside one text block
     *
     * A block that is itself, or sits inside, a link or an ignore span is
     * left alone. Otherwise only direct children of the block are considered:
     * - a text child has each whole-word occurrence of the label split out
     *   into a new link, the surrounding text kept as separate text nodes
     * - an element child whose entire text equals the label gets its content
     *   wrapped in a link, unless it is a link itself or holds a link or an
     *   ignore span
     *
     * @return Number of links added
     */
    size_t markup_block(HtmlNode& block, const std::string& label) const;

    /**
     * @brief Build an (empty) link element for a reference
     */
    static std::unique_ptr<HtmlNode> make_link(const Reference& reference);

private:
    const ReferenceIndex& index_;

    size_t split_text_node(std::unique_ptr<HtmlNode> child,
                           const std::string& label,
                           const Reference& reference,
                           std::vector<std::unique_ptr<HtmlNode>>& rebuilt) const;
};

} // namespace lodbook
