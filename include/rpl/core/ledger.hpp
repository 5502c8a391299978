#pragma once

/**
 * @file ledger.hpp
 * @brief Durable list of currently-held external resources
 *
 * WHAT IT DOES:
 * A ledger is a JSON array file with one object per held resource
 * (snapshot, drive mapping). Every mutation rewrites the whole file through
 * write_file_atomic(), so the file is either the old list or the new list,
 * never a torn mix. A record is only considered held once append() has
 * returned Ok.
 *
 * CORRUPTION POLICY:
 * An unreadable or malformed file is treated as an empty ledger and logged
 * as a warning. Individual malformed entries are dropped the same way.
 * Losing crash-recovery tracking never blocks a new run.
 *
 * RECORD REQUIREMENTS:
 * - std::string key() const              unique identity inside the ledger
 * - nlohmann::json to_json() const
 * - static Record from_json(const nlohmann::json&)   may throw on bad input
 *
 * THREAD SAFETY:
 * All operations are serialized by an internal mutex.
 *
 * EXAMPLE:
 * Ledger<MappingRecord> ledger(state_dir / "mappings.json");
 * ledger.append(record);
 * for (const auto& held : ledger.list()) { ... }
 * ledger.remove(record.key());
 */

#include "rpl/core/atomic_file.hpp"
#include "rpl/core/result.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rpl::core {

/**
 * @brief Outcome of a crash-recovery sweep over a ledger
 */
struct ReconcileReport {
    std::size_t found = 0;
    std::size_t released = 0;
    std::size_t failed = 0;
};

template<typename Record>
class Ledger {
public:
    explicit Ledger(std::filesystem::path file) : file_(std::move(file)) {}

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /**
     * @brief Add a record, replacing any record with the same key
     *
     * Returns only after the file has been rewritten and fsynced.
     */
    Result<void> append(const Record& record) {
        std::lock_guard lock(mutex_);
        auto records = read_all();
        const auto key = record.key();
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&key](const Record& r) { return r.key() == key; }),
                      records.end());
        records.push_back(record);
        return write_all(records);
    }

    /**
     * @brief Remove the record with this key
     *
     * RETURNS: true if a record was removed, false if the key was unknown
     * (not an error; removal is idempotent).
     */
    Result<bool> remove(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto records = read_all();
        const auto before = records.size();
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&key](const Record& r) { return r.key() == key; }),
                      records.end());
        if (records.size() == before) {
            return Ok(false);
        }
        auto written = write_all(records);
        if (written.is_error()) {
            return Err<bool>(written.error());
        }
        return Ok(true);
    }

    std::vector<Record> list() const {
        std::lock_guard lock(mutex_);
        return read_all();
    }

    std::optional<Record> find(const std::string& key) const {
        std::lock_guard lock(mutex_);
        for (auto& record : read_all()) {
            if (record.key() == key) {
                return record;
            }
        }
        return std::nullopt;
    }

    const std::filesystem::path& path() const noexcept { return file_; }

private:
    std::vector<Record> read_all() const {
        std::vector<Record> records;

        auto contents = read_file(file_);
        if (contents.is_error()) {
            spdlog::warn("[Ledger] {} unreadable, treating as empty: {}",
                         file_.string(), contents.error().message);
            return records;
        }
        if (!contents.value().has_value() || contents.value()->empty()) {
            return records;
        }

        auto document = nlohmann::json::parse(*contents.value(), nullptr, false);
        if (document.is_discarded() || !document.is_array()) {
            spdlog::warn("[Ledger] {} is malformed, treating as empty", file_.string());
            return records;
        }

        for (const auto& entry : document) {
            try {
                records.push_back(Record::from_json(entry));
            } catch (const std::exception& e) {
                spdlog::warn("[Ledger] {} dropping malformed entry: {}", file_.string(), e.what());
            }
        }
        return records;
    }

    Result<void> write_all(const std::vector<Record>& records) const {
        nlohmann::json document = nlohmann::json::array();
        for (const auto& record : records) {
            document.push_back(record.to_json());
        }
        return write_file_atomic(file_, document.dump(2));
    }

    std::filesystem::path file_;
    mutable std::mutex mutex_;
};

} // namespace rpl::core
