#pragma once

#include "core/advisory.hpp"
#include "record/record_store.hpp"
#include "record/type_registry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lodbook {

/**
 * @brief Everything a build stage needs to resolve names and build identifiers
 *
 * Passed explicitly into every core call. The store and registry are shared
 * and read-only; advisories go to the log.
 */
struct BuildContext {
    const RecordStore& store;
    const TypeRegistry& types;
    AdvisoryLog& advisories;
    std::string site_url;               // e.g. "https://example.org"
    std::string base_url;               // e.g. "/book", may be empty
    nlohmann::json lod_context = "http://schema.org/";

    BuildContext(const RecordStore& store, const TypeRegistry& types, AdvisoryLog& advisories,
                 const std::string& site_url = "", const std::string& base_url = "")
        : store(store), types(types), advisories(advisories),
          site_url(site_url), base_url(base_url) {}

    /**
     * @brief Absolute URI of an entity: <url><baseurl>/<collection>/<slug>/
     */
    std::string entity_uri(const std::string& collection, const std::string& name) const;

    /**
     * @brief Site-relative URL of an entity page: <baseurl>/<collection>/<slug>/
     */
    std::string entity_url(const std::string& collection, const std::string& name) const;

    /**
     * @brief Absolute URI of a site page given its site-relative URL
     */
    std::string page_uri(const std::string& page_url) const;
};

/**
 * @brief Turn a name into a URL path segment
 *
 * ASCII letters are lowercased, ASCII digits and non-ASCII bytes are kept,
 * every other run of characters becomes a single '-', and leading or
 * trailing '-' are trimmed. "James Minahan" -> "james-minahan".
 */
std::string slugify(const std::string& name);

} // namespace lodbook
