#pragma once

#include "core/advisory.hpp"
#include "core/build_context.hpp"
#include "codec/jsonld_codec.hpp"
#include "document/narrative_document.hpp"
#include "linking/document_processor.hpp"
#include "linking/graph_assembler.hpp"
#include "pipeline/site_config.hpp"
#include "record/record_store.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lodbook {

// ============================================================================
// Build Statistics
// ============================================================================

struct BuildStatistics {
    // Records
    int records_loaded = 0;
    int entity_pages = 0;
    int unconfigured_records = 0;
    int conflicting_records = 0;

    // Documents
    int documents_processed = 0;
    int documents_failed = 0;

    // Linking
    int references_found = 0;
    int labels_linked = 0;
    int mentions_extracted = 0;
    int advisories = 0;

    // Timing
    double total_time_seconds = 0.0;
    double document_time_seconds = 0.0;
    double entity_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Site Builder
// ============================================================================

/**
 * @brief Two-phase build of a linked narrative site
 *
 * Phase 1 links every document and compiles its graph. Phase 2 compiles
 * every entity page and folds in the documents that mention it; it starts
 * only after phase 1 has finished for all documents.
 *
 * Output layout under the output directory:
 *   <document url>/index.html, index.json
 *   <collection>/<slug>/index.json, page.json
 *   build_statistics.json
 */
class SiteBuilder {
public:
    /**
     * @brief Validate the configuration and load the records
     * @throws std::invalid_argument on invalid configuration
     * @throws std::runtime_error if the records file cannot be loaded
     */
    explicit SiteBuilder(const SiteConfig& config);

    SiteBuilder(const SiteBuilder&) = delete;
    SiteBuilder& operator=(const SiteBuilder&) = delete;

    /**
     * @brief Run both phases and write every output file
     */
    BuildStatistics build();

    /**
     * @brief Phase 1 over every configured document
     *
     * A document that cannot be read is counted as failed and skipped.
     * @throws std::logic_error if phase 1 has already run
     */
    void process_documents();

    /**
     * @brief Phase 2 over every record with a configured type
     *
     * A record whose name slugs to nothing, or to a page path an earlier
     * record in the same collection already took, gets no page and is
     * reported as page_path_conflict.
     * @throws std::logic_error if phase 1 has not run, or phase 2 already has
     */
    void process_entities();

    void write_outputs() const;

    /**
     * @brief Phase 1 for one chapter source outside the configured set
     */
    NarrativeDocument link_document(const DocumentInfo& info, const std::string& source);

    /**
     * @brief Compiled graph of one entity, without mentions
     */
    std::optional<GraphNode> entity_graph(const std::string& name) const;

    const SiteConfig& config() const { return config_; }
    const RecordStore& records() const { return store_; }
    const std::vector<NarrativeDocument>& documents() const { return documents_; }
    const std::vector<DocumentReport>& document_reports() const { return reports_; }
    const std::vector<EntityPage>& entity_pages() const { return pages_; }
    const AdvisoryLog& advisories() const { return advisories_; }
    const JsonLdCodec& codec() const { return *codec_; }
    BuildStatistics get_statistics() const { return stats_; }

    void set_progress_callback(ProgressCallback callback);

private:
    SiteConfig config_;
    InMemoryRecordStore store_;
    AdvisoryLog advisories_;
    std::unique_ptr<BuildContext> context_;
    std::unique_ptr<JsonLdCodec> codec_;

    std::vector<NarrativeDocument> documents_;
    std::vector<DocumentReport> reports_;
    std::vector<EntityPage> pages_;
    bool documents_done_ = false;
    bool entities_done_ = false;

    BuildStatistics stats_;
    ProgressCallback progress_callback_;

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message = "");

    std::optional<EntityPage> make_entity_page(const Record& record);
    bool claim_page_path(const EntityPage& page, std::set<std::string>& taken);
};

/**
 * @brief Read a whole file
 * @throws std::runtime_error if it cannot be opened
 */
std::string read_file(const std::string& path);

/**
 * @brief Write a whole file, creating parent directories
 * @throws std::runtime_error if it cannot be written
 */
void write_file(const std::string& path, const std::string& content);

/**
 * @brief Directory a site-relative page URL is published in
 */
std::string page_directory(const std::string& output_directory, const std::string& url);

} // namespace lodbook
