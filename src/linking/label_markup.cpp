#include "linking/label_markup.hpp"
#include "text/tokenizer.hpp"

namespace lodbook {

namespace {

bool is_skipped(const HtmlNode& node) {
    return node.has_class(kLinkClass) || node.has_class(kIgnoreClass);
}

// A link or an ignore span anywhere inside rules out wrapping the element
bool holds_link_or_ignore(const HtmlNode& node) {
    std::vector<const HtmlNode*> found;
    node.find_all([](const HtmlNode& n) {
        return n.is_element("a") || n.has_class(kIgnoreClass);
    }, found);
    return !found.empty();
}

// The block itself, or any element around it, is a link or an ignore span
bool inside_skipped(const HtmlNode& block) {
    for (const HtmlNode* node = &block; node; node = node->parent) {
        if (is_skipped(*node)) {
            return true;
        }
    }
    return false;
}

}  // namespace

LabelMarkupEngine::LabelMarkupEngine(const ReferenceIndex& index) : index_(index) {}

std::unique_ptr<HtmlNode> LabelMarkupEngine::make_link(const Reference& reference) {
    return HtmlNode::make_element("a", {
        {"class", kLinkClass},
        {"data-name", reference.name},
        {"data-collection", reference.collection},
        {"property", "name"},
        {"href", reference.url}
    });
}

size_t LabelMarkupEngine::markup(NarrativeDocument& document) const {
    size_t added = 0;
    auto labels = index_.labels_by_length();

    for (HtmlNode* block : document.text_blocks()) {
        if (inside_skipped(*block)) {
            continue;
        }
        for (const auto& label : labels) {
            added += markup_block(*block, label);
        }
    }

    return added;
}

size_t LabelMarkupEngine::markup_block(HtmlNode& block, const std::string& label) const {
    const Reference* reference = index_.find(label);
    if (!reference || label.empty() || inside_skipped(block)) {
        return 0;
    }

    size_t added = 0;
    std::vector<std::unique_ptr<HtmlNode>> rebuilt;

    for (auto& child : block.take_children()) {
        if (is_skipped(*child)) {
            rebuilt.push_back(std::move(child));
            continue;
        }

        if (child->is_text()) {
            added += split_text_node(std::move(child), label, *reference, rebuilt);
            continue;
        }

        if (child->is_element() && !child->is_element("a") &&
            child->text_content() == label && !holds_link_or_ignore(*child)) {
            auto link = make_link(*reference);
            link->set_children(child->take_children());
            child->append_child(std::move(link));
            added++;
        }

        rebuilt.push_back(std::move(child));
    }

    block.set_children(std::move(rebuilt));
    return added;
}

size_t LabelMarkupEngine::split_text_node(std::unique_ptr<HtmlNode> child,
                                          const std::string& label,
                                          const Reference& reference,
                                          std::vector<std::unique_ptr<HtmlNode>>& rebuilt) const {
    const std::string& text = child->text;
    auto offsets = find_whole_word(text, label);
    if (offsets.empty()) {
        rebuilt.push_back(std::move(child));
        return 0;
    }

    size_t pos = 0;
    for (size_t offset : offsets) {
        if (offset > pos) {
            rebuilt.push_back(HtmlNode::make_text(text.substr(pos, offset - pos)));
        }
        auto link = make_link(reference);
        link->append_child(HtmlNode::make_text(label));
        rebuilt.push_back(std::move(link));
        pos = offset + label.size();
    }
    if (pos < text.size()) {
        rebuilt.push_back(HtmlNode::make_text(text.substr(pos)));
    }

    return offsets.size();
}

} // namespace lodbook
