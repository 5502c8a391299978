#pragma once

#include "rpl/core/identifiers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace rpl::network {

/**
 * @brief One held drive mapping, as persisted in the mapping ledger
 *
 * remote_root is the share root (\\server\share); mapped_path is the local
 * directory the share root is reachable at.
 */
struct MappingRecord {
    DriveLetter letter;
    std::string remote_root;
    std::string original_path;
    std::string mapped_path;
    std::chrono::system_clock::time_point created_at{};

    [[nodiscard]] std::string key() const { return letter.str(); }

    nlohmann::json to_json() const;
    static MappingRecord from_json(const nlohmann::json& j);
};

} // namespace rpl::network
