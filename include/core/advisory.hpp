#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>

namespace lodbook {

// Advisory kinds (recoverable problems reported during a build)
enum class AdvisoryKind {
    UNRESOLVED_REFERENCE,
    UNCONFIGURED_TYPE,
    MISSING_IMAGE_RECORD,
    UNSUPPORTED_IMAGE_FORMAT,
    MALFORMED_MARKER,
    PAGE_PATH_CONFLICT
};

inline std::string advisory_kind_to_string(AdvisoryKind kind) {
    switch (kind) {
        case AdvisoryKind::UNRESOLVED_REFERENCE: return "unresolved_reference";
        case AdvisoryKind::UNCONFIGURED_TYPE: return "unconfigured_type";
        case AdvisoryKind::MISSING_IMAGE_RECORD: return "missing_image_record";
        case AdvisoryKind::UNSUPPORTED_IMAGE_FORMAT: return "unsupported_image_format";
        case AdvisoryKind::MALFORMED_MARKER: return "malformed_marker";
        case AdvisoryKind::PAGE_PATH_CONFLICT: return "page_path_conflict";
        default: return "unknown";
    }
}

/**
 * @brief A single non-fatal problem found while compiling records or documents
 */
struct Advisory {
    AdvisoryKind kind;
    std::string subject;        ///< Record name, reference name or file
    std::string message;

    nlohmann::json to_json() const;
};

/**
 * @brief Collects advisories for the surrounding build to report
 *
 * Nothing recorded here aborts a build. An advisory identical to one
 * already recorded (same kind, subject and message) is dropped. When
 * verbose, every new advisory is echoed to stderr as it arrives.
 */
class AdvisoryLog {
public:
    explicit AdvisoryLog(bool verbose = false) : verbose_(verbose) {}

    void report(AdvisoryKind kind, const std::string& subject, const std::string& message);

    const std::vector<Advisory>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief Number of advisories of one kind
     */
    size_t count(AdvisoryKind kind) const;

    /**
     * @brief Counts keyed by kind name, for summaries
     */
    std::map<std::string, size_t> count_by_kind() const;

    void set_verbose(bool verbose) { verbose_ = verbose; }
    void clear() {
        entries_.clear();
        seen_.clear();
    }

    nlohmann::json to_json() const;

private:
    bool verbose_;
    std::vector<Advisory> entries_;
    std::set<std::string> seen_;
};

} // namespace lodbook
