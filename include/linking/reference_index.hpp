#pragma once

#include "document/narrative_document.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace lodbook {

/// Class carried by every entity link
inline const char* const kLinkClass = "lod-link";
/// Class of spans that auto-linking must never enter
inline const char* const kIgnoreClass = "lod-ignore";

/**
 * @brief An entity reference established by an explicit marker
 */
struct Reference {
    std::string label;          ///< Visible text of the marker
    std::string name;           ///< Resolved entity name (data-name)
    std::string collection;     ///< Entity collection (data-collection)
    std::string url;            ///< Canonical URL (href)

    nlohmann::json to_json() const;
};

/**
 * @brief Label text -> resolved reference, for one document
 *
 * Built once from the links explicit markers left in the rendered text and
 * read-only afterwards. A label seen again replaces the earlier reference.
 */
class ReferenceIndex {
public:
    ReferenceIndex() = default;

    /**
     * @brief Scan text blocks for marker links (`a[property=name]`)
     */
    static ReferenceIndex collect(const NarrativeDocument& document);

    void add(const Reference& reference);

    const Reference* find(const std::string& label) const;

    /**
     * @brief All labels, longest first (ties in byte order)
     */
    std::vector<std::string> labels_by_length() const;

    /**
     * @brief Distinct entity names, in the order they were first seen
     */
    std::vector<std::string> entity_names() const;

    const std::vector<Reference>& references() const { return references_; }
    size_t size() const { return references_.size(); }
    bool empty() const { return references_.empty(); }

    nlohmann::json to_json() const;

private:
    std::vector<Reference> references_;
    std::unordered_map<std::string, size_t> by_label_;
    std::vector<std::string> names_;
};

} // namespace lodbook
