#ifndef LODBOOK_RECORD_HPP
#define LODBOOK_RECORD_HPP

#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace lodbook {

class PropertyValue;

using PropertyEntry = std::pair<std::string, PropertyValue>;
using PropertyMap = std::vector<PropertyEntry>;
using PropertyList = std::vector<PropertyValue>;

/**
 * @brief One value in a record's property tree
 *
 * A value is exactly one of:
 * - SCALAR: string, number, boolean or date string
 * - REFERENCE: a mapping carrying a `name` key, pointing at another record
 * - OBJECT: any other mapping of property -> value
 * - LIST: an ordered sequence of values
 *
 * Mappings loaded from JSON hold their entries in key order. Lookups by key are exact and
 * case-sensitive.
 */
class PropertyValue {
public:
    enum class Kind {
        SCALAR,
        REFERENCE,
        OBJECT,
        LIST
    };

    PropertyValue();

    static PropertyValue scalar(const nlohmann::json& value);

    /**
     * @brief Build a mapping value; classified as REFERENCE when it has `name`
     */
    static PropertyValue mapping(PropertyMap entries);

    static PropertyValue list(PropertyList items);

    /**
     * @brief Classify a parsed JSON value recursively
     */
    static PropertyValue from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    Kind kind() const { return kind_; }
    bool is_scalar() const { return kind_ == Kind::SCALAR; }
    bool is_reference() const { return kind_ == Kind::REFERENCE; }
    bool is_mapping() const { return kind_ == Kind::REFERENCE || kind_ == Kind::OBJECT; }
    bool is_list() const { return kind_ == Kind::LIST; }

    const nlohmann::json& as_scalar() const;
    const PropertyMap& entries() const;
    const PropertyList& items() const;

    /**
     * @brief Scalar rendered as text (strings unquoted, others dumped)
     */
    std::string scalar_text() const;

    /**
     * @brief Find an entry of a mapping value, nullptr if absent or not a mapping
     */
    const PropertyValue* get(const std::string& key) const;
    bool has(const std::string& key) const { return get(key) != nullptr; }

private:
    Kind kind_;
    nlohmann::json scalar_;
    PropertyMap entries_;
    PropertyList items_;
};

/**
 * @brief An entity record (person, place, event, image ...) keyed by name
 */
struct Record {
    std::string name;                   // Unique key within the store
    std::string type;                   // Type tag, resolved through the TypeRegistry
    std::string id;                     // Explicit identifier, empty when absent
    PropertyMap properties;             // Every other property, in key order

    bool has_explicit_id() const { return !id.empty(); }

    const PropertyValue* property(const std::string& key) const;

    /**
     * @brief Create record from JSON
     * @throws std::invalid_argument when `name` is missing or not a string
     */
    static Record from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace lodbook

#endif // LODBOOK_RECORD_HPP
