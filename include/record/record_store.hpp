#pragma once

#include "record/record.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace lodbook {

/**
 * @brief Read-only lookup of entity records by exact name
 *
 * Shared by every stage of a build; nothing writes to a store once the
 * records are loaded.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @brief Find a record by exact, case-sensitive name
     * @return The record, or nullptr if no record has that name
     */
    virtual const Record* find(const std::string& name) const = 0;

    /**
     * @brief All records in load order
     */
    virtual const std::vector<Record>& records() const = 0;

    size_t size() const { return records().size(); }
};

/**
 * @brief RecordStore backed by a parsed JSON data file
 *
 * Accepts either a plain array of records or a JSON-LD object whose
 * `@graph` holds the records (its `@context`, if any, is kept).
 */
class InMemoryRecordStore : public RecordStore {
public:
    InMemoryRecordStore() = default;

    /**
     * @brief Add a record; a name already present keeps its first record
     * @return false if the name was a duplicate
     */
    bool add(Record record);

    const Record* find(const std::string& name) const override;
    const std::vector<Record>& records() const override { return records_; }

    /**
     * @brief Context declared by the data file, null when it has none
     */
    const nlohmann::json& declared_context() const { return declared_context_; }

    static InMemoryRecordStore from_json(const nlohmann::json& j, bool verbose = false);

    /**
     * @brief Load records from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static InMemoryRecordStore load_from_json(const std::string& filename, bool verbose = false);

private:
    std::vector<Record> records_;
    std::unordered_map<std::string, size_t> by_name_;
    nlohmann::json declared_context_;
};

} // namespace lodbook
