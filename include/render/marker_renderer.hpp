#pragma once

#include "core/build_context.hpp"
#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief Expands explicit entity markers in chapter sources
 *
 * Supported block tags (may nest):
 *   {% lod %}James Minahan{% endlod %}
 *   {% lod James Minahan %}Mr Minahan{% endlod %}
 *   {% lod_ignore %}James{% endlod_ignore %}
 *
 * A resolved `lod` block becomes an `a.lod-link` carrying the entity name,
 * collection and page URL around the block's content. An unresolved or
 * empty lookup leaves the content unlinked. `lod_ignore` wraps its content
 * in `span.lod-ignore`. Other `{% ... %}` tags pass through untouched.
 */
class MarkerRenderer {
public:
    explicit MarkerRenderer(const BuildContext& context);

    /**
     * @brief Render all markers in `source`
     * @param subject Name used in advisories (usually the source file)
     */
    std::string render(const std::string& source, const std::string& subject = "") const;

    /**
     * @brief Link HTML for a resolved entity, or `content` unchanged when
     *        the name does not resolve
     */
    std::string render_link(const std::string& name, const std::string& content) const;

    static std::string render_ignore(const std::string& content);

private:
    struct Tag {
        size_t begin = 0;
        size_t end = 0;
        std::string name;
        std::string args;
    };

    const BuildContext& context_;

    static bool next_tag(const std::string& text, size_t from, Tag& tag);

    std::string render_block(const std::string& text,
                             size_t& pos,
                             std::vector<std::string>& open,
                             bool& closed,
                             const std::string& subject) const;
};

} // namespace lodbook
