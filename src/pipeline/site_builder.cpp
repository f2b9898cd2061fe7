#include "pipeline/site_builder.hpp"
#include "graph/graph_compiler.hpp"
#include "render/image_resolver.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lodbook {

// ============================================================================
// File helpers
// ============================================================================

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const std::string& path, const std::string& content) {
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write file: " + path);
    }
    file << content;
}

std::string page_directory(const std::string& output_directory, const std::string& url) {
    std::string relative = url;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return (fs::path(output_directory) / relative).lexically_normal().string();
}

// ============================================================================
// BuildStatistics
// ============================================================================

void BuildStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Build Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Records:\n";
    std::cout << "  Loaded: " << records_loaded << "\n";
    std::cout << "  Entity pages: " << entity_pages << "\n";
    std::cout << "  Unconfigured: " << unconfigured_records << "\n";
    std::cout << "  Page path conflicts: " << conflicting_records << "\n\n";

    std::cout << "Documents:\n";
    std::cout << "  Processed: " << documents_processed << "\n";
    std::cout << "  Failed: " << documents_failed << "\n\n";

    std::cout << "Linking:\n";
    std::cout << "  References found: " << references_found << "\n";
    std::cout << "  Labels auto-linked: " << labels_linked << "\n";
    std::cout << "  Mentions extracted: " << mentions_extracted << "\n";
    std::cout << "  Advisories: " << advisories << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Documents: " << document_time_seconds << " seconds\n";
    std::cout << "  Entities: " << entity_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json BuildStatistics::to_json() const {
    json j;

    j["records_loaded"] = records_loaded;
    j["entity_pages"] = entity_pages;
    j["unconfigured_records"] = unconfigured_records;
    j["conflicting_records"] = conflicting_records;

    j["documents_processed"] = documents_processed;
    j["documents_failed"] = documents_failed;

    j["references_found"] = references_found;
    j["labels_linked"] = labels_linked;
    j["mentions_extracted"] = mentions_extracted;
    j["advisories"] = advisories;

    j["total_time_seconds"] = total_time_seconds;
    j["document_time_seconds"] = document_time_seconds;
    j["entity_time_seconds"] = entity_time_seconds;

    return j;
}

// ============================================================================
// SiteBuilder
// ============================================================================

SiteBuilder::SiteBuilder(const SiteConfig& config)
    : config_(config), advisories_(config.verbose) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    store_ = InMemoryRecordStore::load_from_json(config_.data_file, config_.verbose);
    stats_.records_loaded = static_cast<int>(store_.size());

    context_ = std::make_unique<BuildContext>(store_, config_.types, advisories_,
                                              config_.url, config_.baseurl);
    context_->lod_context = config_.resolve_context(store_.declared_context());
    codec_ = std::make_unique<JsonLdCodec>(context_->lod_context);

    if (config_.verbose) {
        std::cout << "Loaded " << store_.size() << " records from "
                  << config_.data_file << "\n";
    }
}

void SiteBuilder::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

BuildStatistics SiteBuilder::build() {
    auto start_time = std::chrono::high_resolution_clock::now();

    process_documents();
    process_entities();

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.total_time_seconds = std::chrono::duration<double>(end_time - start_time).count();
    stats_.advisories = static_cast<int>(advisories_.size());

    write_outputs();

    return stats_;
}

void SiteBuilder::process_documents() {
    if (documents_done_) {
        throw std::logic_error("Documents have already been linked");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    DocumentProcessor processor(*context_, *codec_, config_.collections);
    const auto& infos = config_.documents;

    for (size_t i = 0; i < infos.size(); ++i) {
        report_progress("Linking document", static_cast<int>(i + 1),
                        static_cast<int>(infos.size()), infos[i].source_path);

        try {
            std::string source = read_file(infos[i].source_path);
            NarrativeDocument document = processor.load(infos[i], source, config_.text_container);
            DocumentReport report = processor.process(document);

            stats_.documents_processed++;
            stats_.references_found += static_cast<int>(report.references);
            stats_.labels_linked += static_cast<int>(report.links_added);

            reports_.push_back(report);
            documents_.push_back(std::move(document));
        } catch (const std::exception& e) {
            stats_.documents_failed++;
            std::cerr << "Failed to process " << infos[i].source_path
                      << ": " << e.what() << "\n";
        }
    }

    documents_done_ = true;

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.document_time_seconds += std::chrono::duration<double>(end_time - start_time).count();
}

void SiteBuilder::process_entities() {
    if (!documents_done_) {
        throw std::logic_error("Entities can only be assembled after every document is linked");
    }
    if (entities_done_) {
        throw std::logic_error("Entities have already been assembled");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    GraphAssembler assembler(static_cast<size_t>(config_.context_words));
    const auto& records = store_.records();
    std::set<std::string> taken;

    for (size_t i = 0; i < records.size(); ++i) {
        report_progress("Assembling entity", static_cast<int>(i + 1),
                        static_cast<int>(records.size()), records[i].name);

        auto page = make_entity_page(records[i]);
        if (!page) {
            stats_.unconfigured_records++;
            continue;
        }
        if (!claim_page_path(*page, taken)) {
            stats_.conflicting_records++;
            continue;
        }

        assembler.enrich(*page, documents_);
        stats_.mentions_extracted += static_cast<int>(page->contexts.size());
        pages_.push_back(std::move(*page));
    }

    stats_.entity_pages = static_cast<int>(pages_.size());
    entities_done_ = true;

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.entity_time_seconds += std::chrono::duration<double>(end_time - start_time).count();
}

std::optional<EntityPage> SiteBuilder::make_entity_page(const Record& record) {
    auto info = config_.types.get(record.type);
    if (!info) {
        advisories_.report(AdvisoryKind::UNCONFIGURED_TYPE, record.name,
                           "type '" + record.type + "' has no data_types entry, no page generated");
        return std::nullopt;
    }

    GraphCompiler compiler(*context_);

    EntityPage page;
    page.title = record.name;
    page.collection = info->collection;
    page.template_name = info->template_name;
    page.url = context_->entity_url(info->collection, record.name);
    page.graph = compiler.compile_entity(record);

    const PropertyValue* image = record.property("image");
    if (image) {
        ImageResolver images(*context_);
        page.image_file = images.resolve(*image);
    }

    return page;
}

// Pages are written to <collection>/<slug>/, so each path has one owner
bool SiteBuilder::claim_page_path(const EntityPage& page, std::set<std::string>& taken) {
    std::string slug = slugify(page.title);
    if (slug.empty()) {
        advisories_.report(AdvisoryKind::PAGE_PATH_CONFLICT, page.title,
                           "name has no characters usable in a page path, no page generated");
        return false;
    }

    std::string path = page.collection + "/" + slug;
    if (!taken.insert(path).second) {
        advisories_.report(AdvisoryKind::PAGE_PATH_CONFLICT, page.title,
                           "page path '" + path + "' is already used by another record, no page generated");
        return false;
    }
    return true;
}

void SiteBuilder::write_outputs() const {
    const std::string& out = config_.output_directory;
    fs::create_directories(out);

    for (const auto& document : documents_) {
        std::string dir = page_directory(out, document.info().url);
        write_file((fs::path(dir) / "index.html").string(), document.to_html());
        write_file((fs::path(dir) / "index.json").string(), codec_->serialize(document.graph()));
    }

    for (const auto& page : pages_) {
        std::string dir = (fs::path(out) / page.collection / slugify(page.title)).string();
        write_file((fs::path(dir) / "index.json").string(), codec_->serialize(page.graph));
        write_file((fs::path(dir) / "page.json").string(), page.to_json().dump(2));
    }

    json stats = stats_.to_json();
    stats["advisories_by_kind"] = advisories_.count_by_kind();
    stats["advisory_log"] = advisories_.to_json();
    write_file((fs::path(out) / "build_statistics.json").string(), stats.dump(2));

    if (config_.verbose) {
        std::cout << "Wrote " << documents_.size() << " documents and " << pages_.size()
                  << " entity pages to " << out << "\n";
    }
}

NarrativeDocument SiteBuilder::link_document(const DocumentInfo& info, const std::string& source) {
    DocumentProcessor processor(*context_, *codec_, config_.collections);
    NarrativeDocument document = processor.load(info, source, config_.text_container);
    DocumentReport report = processor.process(document);

    if (config_.verbose) {
        std::cout << "Linked " << (info.url.empty() ? info.source_path : info.url) << ": "
                  << report.references << " references, "
                  << report.links_added << " links added\n";
    }
    return document;
}

std::optional<GraphNode> SiteBuilder::entity_graph(const std::string& name) const {
    const Record* record = store_.find(name);
    if (!record) {
        return std::nullopt;
    }
    GraphCompiler compiler(*context_);
    return compiler.compile_entity(*record);
}

void SiteBuilder::report_progress(const std::string& stage, int current, int total,
                                  const std::string& message) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

} // namespace lodbook
