#include "core/advisory.hpp"
#include <iostream>

namespace lodbook {

nlohmann::json Advisory::to_json() const {
    nlohmann::json j;
    j["kind"] = advisory_kind_to_string(kind);
    j["subject"] = subject;
    j["message"] = message;
    return j;
}

void AdvisoryLog::report(AdvisoryKind kind, const std::string& subject, const std::string& message) {
    std::string key = advisory_kind_to_string(kind) + '\x1f' + subject + '\x1f' + message;
    if (!seen_.insert(key).second) {
        return;
    }
    if (verbose_) {
        std::cerr << "[" << advisory_kind_to_string(kind) << "] "
                  << subject << ": " << message << "\n";
    }
    entries_.push_back(Advisory{kind, subject, message});
}

size_t AdvisoryLog::count(AdvisoryKind kind) const {
    size_t n = 0;
    for (const auto& entry : entries_) {
        if (entry.kind == kind) n++;
    }
    return n;
}

std::map<std::string, size_t> AdvisoryLog::count_by_kind() const {
    std::map<std::string, size_t> counts;
    for (const auto& entry : entries_) {
        counts[advisory_kind_to_string(entry.kind)]++;
    }
    return counts;
}

nlohmann::json AdvisoryLog::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& entry : entries_) {
        arr.push_back(entry.to_json());
    }
    return arr;
}

} // namespace lodbook
