#include "record/record_store.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace lodbook {

bool InMemoryRecordStore::add(Record record) {
    if (by_name_.count(record.name)) {
        return false;
    }
    by_name_[record.name] = records_.size();
    records_.push_back(std::move(record));
    return true;
}

const Record* InMemoryRecordStore::find(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

InMemoryRecordStore InMemoryRecordStore::from_json(const nlohmann::json& j, bool verbose) {
    InMemoryRecordStore store;

    const nlohmann::json* graph = &j;
    if (j.is_object() && j.contains("@graph")) {
        graph = &j["@graph"];
        if (j.contains("@context")) {
            store.declared_context_ = j["@context"];
        }
    }

    if (!graph->is_array()) {
        throw std::runtime_error("Record data must be an array or an object with '@graph'");
    }

    size_t index = 0;
    for (const auto& item : *graph) {
        try {
            Record record = Record::from_json(item);
            std::string name = record.name;
            if (!store.add(std::move(record))) {
                std::cerr << "Warning: duplicate record name '" << name
                          << "' (entry " << index << "), keeping the first\n";
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Warning: skipping record " << index << ": " << e.what() << "\n";
        }
        index++;
    }

    if (verbose) {
        std::cout << "Loaded " << store.size() << " records\n";
    }

    return store;
}

InMemoryRecordStore InMemoryRecordStore::load_from_json(const std::string& filename, bool verbose) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open record data: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse record data " + filename + ": " + e.what());
    }

    return from_json(j, verbose);
}

} // namespace lodbook
