#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <functional>

namespace lodbook {

/**
 * @brief A node of a mutable HTML tree
 *
 * Gumbo's parse tree is read-only, so parsed documents are copied into this
 * tree. Every child is owned by its parent; `parent` is a non-owning back
 * pointer kept in sync by append_child() and set_children().
 */
struct HtmlNode {
    enum class Type {
        DOCUMENT,
        ELEMENT,
        TEXT,
        COMMENT,
        DOCTYPE
    };

    Type type = Type::ELEMENT;
    std::string tag;                                            // Lowercase element name
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string text;                                           // TEXT, COMMENT and DOCTYPE payload
    std::vector<std::unique_ptr<HtmlNode>> children;
    HtmlNode* parent = nullptr;

    static std::unique_ptr<HtmlNode> make_element(
        const std::string& tag,
        const std::vector<std::pair<std::string, std::string>>& attributes = {}
    );
    static std::unique_ptr<HtmlNode> make_text(const std::string& text);

    bool is_element() const { return type == Type::ELEMENT; }
    bool is_element(const std::string& name) const { return type == Type::ELEMENT && tag == name; }
    bool is_text() const { return type == Type::TEXT; }

    bool has_attribute(const std::string& name) const;
    std::string attribute(const std::string& name, const std::string& default_value = "") const;
    void set_attribute(const std::string& name, const std::string& value);

    /**
     * @brief Check the class attribute for one class name
     */
    bool has_class(const std::string& class_name) const;

    /**
     * @brief Concatenated text of this node and all descendants
     */
    std::string text_content() const;

    HtmlNode* append_child(std::unique_ptr<HtmlNode> child);

    /**
     * @brief Detach and return all children
     */
    std::vector<std::unique_ptr<HtmlNode>> take_children();

    /**
     * @brief Replace the child list, taking ownership and fixing parent pointers
     */
    void set_children(std::vector<std::unique_ptr<HtmlNode>> new_children);

    /**
     * @brief Collect descendants (document order, excluding this node) that match
     */
    void find_all(const std::function<bool(const HtmlNode&)>& predicate,
                  std::vector<HtmlNode*>& out);
    void find_all(const std::function<bool(const HtmlNode&)>& predicate,
                  std::vector<const HtmlNode*>& out) const;
};

/**
 * @brief A parsed HTML document
 */
class HtmlDocument {
public:
    HtmlDocument();

    /**
     * @brief Parse an HTML string with Gumbo
     *
     * Follows the HTML5 parsing algorithm, so any input yields a tree with
     * html, head and body elements.
     */
    static HtmlDocument parse(const std::string& html);

    HtmlNode& root() { return *root_; }
    const HtmlNode& root() const { return *root_; }

    HtmlNode* find_by_id(const std::string& id);
    const HtmlNode* find_by_id(const std::string& id) const;

    /**
     * @brief First element with the given tag name, nullptr if none
     */
    HtmlNode* find_first(const std::string& tag);

    /**
     * @brief Serialize the whole document
     */
    std::string to_html() const;

private:
    std::unique_ptr<HtmlNode> root_;
};

/**
 * @brief All descendant elements of `scope` named `tag`, in document order
 */
std::vector<HtmlNode*> find_elements(HtmlNode& scope, const std::string& tag);
std::vector<const HtmlNode*> find_elements(const HtmlNode& scope, const std::string& tag);

std::string outer_html(const HtmlNode& node);
std::string inner_html(const HtmlNode& node);

/**
 * @brief Called once per serialized element with its byte range in the output
 */
using ElementSpanCallback = std::function<void(const HtmlNode& element, size_t begin, size_t end)>;

/**
 * @brief Serialize the children of `node`, reporting where each element landed
 *
 * Elements are reported when their end tag is written, so a parent is
 * reported after its descendants.
 */
std::string inner_html(const HtmlNode& node, const ElementSpanCallback& on_element);

/**
 * @brief Escape text content (&, <, >)
 */
std::string escape_text(const std::string& s);

/**
 * @brief Escape a double-quoted attribute value (&, ")
 */
std::string escape_attribute(const std::string& s);

} // namespace lodbook
