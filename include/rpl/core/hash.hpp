#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace rpl::core {

inline constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
inline constexpr std::uint64_t kFnvPrime  = 0x100000001b3ULL;

inline std::uint64_t fnv1a_64(std::string_view data, std::uint64_t hash = kFnvOffset) {
    for (char c : data) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
    return hash;
}

inline std::string hash_to_hex(std::uint64_t hash) {
    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return hex.str();
}

} // namespace rpl::core
