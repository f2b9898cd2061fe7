#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <optional>

namespace lodbook {

/**
 * @brief How one record type tag is published
 */
struct TypeInfo {
    std::string graph_type;     ///< Canonical linked-data type, e.g. "Person"
    std::string collection;     ///< Output collection, e.g. "people"
    std::string template_name;  ///< Page template

    nlohmann::json to_json() const;
};

/**
 * @brief Maps record type tags to {graph type, collection, template}
 *
 * Configured once from `data_types` and read-only for the whole build.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    void add(const std::string& tag, const TypeInfo& info);

    bool has(const std::string& tag) const;
    std::optional<TypeInfo> get(const std::string& tag) const;

    /**
     * @brief Canonical graph type, or the tag itself when unconfigured
     */
    std::string graph_type(const std::string& tag) const;

    /**
     * @brief Collection of a tag, or the tag itself when unconfigured
     */
    std::string collection(const std::string& tag) const;

    size_t size() const { return types_.size(); }

    nlohmann::json to_json() const;

    /**
     * @brief Build from a `data_types` object
     *
     * Entries without a `type` keep the tag as graph type; entries without a
     * `collection` fall back to the tag.
     */
    static TypeRegistry from_json(const nlohmann::json& j);

private:
    std::map<std::string, TypeInfo> types_;
};

} // namespace lodbook
