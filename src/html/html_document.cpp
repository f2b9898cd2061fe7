#include "html/html_document.hpp"
#include <gumbo.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace lodbook {

namespace {

bool is_void_element(const std::string& tag) {
    static const char* const kVoid[] = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "keygen", "link", "meta", "param", "source", "track", "wbr"
    };
    for (const char* name : kVoid) {
        if (tag == name) return true;
    }
    return false;
}

bool is_raw_text_element(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "xmp" || tag == "iframe" ||
           tag == "noembed" || tag == "noframes" || tag == "plaintext";
}

std::string element_name(const GumboElement& element) {
    if (element.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(element.tag);
    }
    // Unknown tags keep their source spelling, lowercased
    GumboStringPiece piece = element.original_tag;
    gumbo_tag_from_original_text(&piece);
    std::string name(piece.data, piece.length);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::unique_ptr<HtmlNode> convert(const GumboNode* node);

void convert_children(const GumboVector& children, HtmlNode& parent) {
    for (unsigned int i = 0; i < children.length; ++i) {
        auto child = convert(static_cast<const GumboNode*>(children.data[i]));
        if (child) {
            parent.append_child(std::move(child));
        }
    }
}

std::unique_ptr<HtmlNode> convert(const GumboNode* node) {
    auto out = std::make_unique<HtmlNode>();

    switch (node->type) {
        case GUMBO_NODE_DOCUMENT:
            out->type = HtmlNode::Type::DOCUMENT;
            if (node->v.document.has_doctype) {
                auto doctype = std::make_unique<HtmlNode>();
                doctype->type = HtmlNode::Type::DOCTYPE;
                doctype->text = node->v.document.name;
                out->append_child(std::move(doctype));
            }
            convert_children(node->v.document.children, *out);
            break;

        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            const GumboElement& element = node->v.element;
            out->type = HtmlNode::Type::ELEMENT;
            out->tag = element_name(element);
            for (unsigned int i = 0; i < element.attributes.length; ++i) {
                const auto* attr = static_cast<const GumboAttribute*>(element.attributes.data[i]);
                out->attributes.emplace_back(attr->name, attr->value);
            }
            convert_children(element.children, *out);
            break;
        }

        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out->type = HtmlNode::Type::TEXT;
            out->text = node->v.text.text;
            break;

        case GUMBO_NODE_COMMENT:
            out->type = HtmlNode::Type::COMMENT;
            out->text = node->v.text.text;
            break;

        default:
            return nullptr;
    }

    return out;
}

void serialize(const HtmlNode& node, std::string& out, const ElementSpanCallback& on_element);

void serialize_children(const HtmlNode& node, std::string& out, const ElementSpanCallback& on_element) {
    for (const auto& child : node.children) {
        serialize(*child, out, on_element);
    }
}

void serialize(const HtmlNode& node, std::string& out, const ElementSpanCallback& on_element) {
    switch (node.type) {
        case HtmlNode::Type::DOCUMENT:
            serialize_children(node, out, on_element);
            break;

        case HtmlNode::Type::DOCTYPE:
            out += "<!DOCTYPE " + (node.text.empty() ? std::string("html") : node.text) + ">\n";
            break;

        case HtmlNode::Type::COMMENT:
            out += "<!--" + node.text + "-->";
            break;

        case HtmlNode::Type::TEXT:
            if (node.parent && node.parent->is_element() && is_raw_text_element(node.parent->tag)) {
                out += node.text;
            } else {
                out += escape_text(node.text);
            }
            break;

        case HtmlNode::Type::ELEMENT: {
            size_t begin = out.size();
            out += "<" + node.tag;
            for (const auto& [name, value] : node.attributes) {
                out += " " + name + "=\"" + escape_attribute(value) + "\"";
            }
            out += ">";
            if (!is_void_element(node.tag)) {
                serialize_children(node, out, on_element);
                out += "</" + node.tag + ">";
            }
            if (on_element) {
                on_element(node, begin, out.size());
            }
            break;
        }
    }
}

template <typename Node, typename Out>
void collect(Node& node, const std::function<bool(const HtmlNode&)>& predicate, Out& out) {
    for (auto& child : node.children) {
        if (predicate(*child)) {
            out.push_back(child.get());
        }
        collect(*child, predicate, out);
    }
}

}  // namespace

// ==========================================
// HtmlNode Implementation
// ==========================================

std::unique_ptr<HtmlNode> HtmlNode::make_element(
    const std::string& tag,
    const std::vector<std::pair<std::string, std::string>>& attributes
) {
    auto node = std::make_unique<HtmlNode>();
    node->type = Type::ELEMENT;
    node->tag = tag;
    node->attributes = attributes;
    return node;
}

std::unique_ptr<HtmlNode> HtmlNode::make_text(const std::string& text) {
    auto node = std::make_unique<HtmlNode>();
    node->type = Type::TEXT;
    node->text = text;
    return node;
}

bool HtmlNode::has_attribute(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.first == name) return true;
    }
    return false;
}

std::string HtmlNode::attribute(const std::string& name, const std::string& default_value) const {
    for (const auto& attr : attributes) {
        if (attr.first == name) return attr.second;
    }
    return default_value;
}

void HtmlNode::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes) {
        if (attr.first == name) {
            attr.second = value;
            return;
        }
    }
    attributes.emplace_back(name, value);
}

bool HtmlNode::has_class(const std::string& class_name) const {
    if (!is_element()) return false;
    std::istringstream classes(attribute("class"));
    std::string item;
    while (classes >> item) {
        if (item == class_name) return true;
    }
    return false;
}

std::string HtmlNode::text_content() const {
    if (type == Type::TEXT) {
        return text;
    }
    if (type == Type::COMMENT || type == Type::DOCTYPE) {
        return "";
    }
    std::string out;
    for (const auto& child : children) {
        out += child->text_content();
    }
    return out;
}

HtmlNode* HtmlNode::append_child(std::unique_ptr<HtmlNode> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return children.back().get();
}

std::vector<std::unique_ptr<HtmlNode>> HtmlNode::take_children() {
    std::vector<std::unique_ptr<HtmlNode>> taken;
    taken.swap(children);
    for (auto& child : taken) {
        child->parent = nullptr;
    }
    return taken;
}

void HtmlNode::set_children(std::vector<std::unique_ptr<HtmlNode>> new_children) {
    children = std::move(new_children);
    for (auto& child : children) {
        child->parent = this;
    }
}

void HtmlNode::find_all(const std::function<bool(const HtmlNode&)>& predicate,
                        std::vector<HtmlNode*>& out) {
    collect(*this, predicate, out);
}

void HtmlNode::find_all(const std::function<bool(const HtmlNode&)>& predicate,
                        std::vector<const HtmlNode*>& out) const {
    collect(*this, predicate, out);
}

// ==========================================
// HtmlDocument Implementation
// ==========================================

HtmlDocument::HtmlDocument() : root_(std::make_unique<HtmlNode>()) {
    root_->type = HtmlNode::Type::DOCUMENT;
}

HtmlDocument HtmlDocument::parse(const std::string& html) {
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        throw std::runtime_error("HTML parser returned no document");
    }

    HtmlDocument doc;
    doc.root_ = convert(output->document);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    if (!doc.root_) {
        throw std::runtime_error("HTML parser returned an empty document");
    }
    return doc;
}

HtmlNode* HtmlDocument::find_by_id(const std::string& id) {
    std::vector<HtmlNode*> found;
    root_->find_all([&id](const HtmlNode& n) {
        return n.is_element() && n.attribute("id") == id;
    }, found);
    return found.empty() ? nullptr : found.front();
}

const HtmlNode* HtmlDocument::find_by_id(const std::string& id) const {
    std::vector<const HtmlNode*> found;
    root_->find_all([&id](const HtmlNode& n) {
        return n.is_element() && n.attribute("id") == id;
    }, found);
    return found.empty() ? nullptr : found.front();
}

HtmlNode* HtmlDocument::find_first(const std::string& tag) {
    auto found = find_elements(*root_, tag);
    return found.empty() ? nullptr : found.front();
}

std::string HtmlDocument::to_html() const {
    return outer_html(*root_);
}

// ==========================================
// Free functions
// ==========================================

std::vector<HtmlNode*> find_elements(HtmlNode& scope, const std::string& tag) {
    std::vector<HtmlNode*> found;
    scope.find_all([&tag](const HtmlNode& n) { return n.is_element(tag); }, found);
    return found;
}

std::vector<const HtmlNode*> find_elements(const HtmlNode& scope, const std::string& tag) {
    std::vector<const HtmlNode*> found;
    scope.find_all([&tag](const HtmlNode& n) { return n.is_element(tag); }, found);
    return found;
}

std::string outer_html(const HtmlNode& node) {
    std::string out;
    serialize(node, out, nullptr);
    return out;
}

std::string inner_html(const HtmlNode& node) {
    std::string out;
    serialize_children(node, out, nullptr);
    return out;
}

std::string inner_html(const HtmlNode& node, const ElementSpanCallback& on_element) {
    std::string out;
    serialize_children(node, out, on_element);
    return out;
}

std::string escape_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string escape_attribute(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace lodbook
