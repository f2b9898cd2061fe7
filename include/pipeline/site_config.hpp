#pragma once

#include "document/narrative_document.hpp"
#include "linking/document_processor.hpp"
#include "record/type_registry.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lodbook {

// ============================================================================
// Site Configuration
// ============================================================================

/**
 * @brief Configuration of one site build
 *
 * Relative paths (records file, document paths, output directory) are
 * resolved against the directory of the configuration file.
 */
struct SiteConfig {
    // Identity
    std::string url;                        ///< Site URL, e.g. "https://example.org"
    std::string baseurl;                    ///< Base path, e.g. "/book" (may be empty)

    // Linked data source
    std::string data_file;                  ///< Records file (JSON array or {"@graph"})
    nlohmann::json lod_context;             ///< Explicit JSON-LD context, null if unset

    // Types and documents
    TypeRegistry types;                     ///< From "data_types"
    std::vector<DocumentInfo> documents;    ///< From "documents"
    std::vector<CollectionStyle> collections;   ///< From "data_collections"

    // Processing
    std::string text_container = "text";    ///< Id of the narrative element
    int context_words = 5;                  ///< Words on each side of a mention

    // Output
    std::string output_directory = "_site";
    bool verbose = true;

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static SiteConfig from_json_file(const std::string& path);

    /**
     * @brief Build from parsed JSON, resolving relative paths against base_dir
     * @throws std::invalid_argument on a malformed data_types entry
     */
    static SiteConfig from_json(const nlohmann::json& j, const std::string& base_dir = "");

    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Context for the codec: explicit context, else the one the
     *        records file declares, else "http://schema.org/"
     */
    nlohmann::json resolve_context(const nlohmann::json& declared_context) const;
};

} // namespace lodbook
