#pragma once

/**
 * @file identifiers.hpp
 * @brief Validated value types for external resource identifiers
 *
 * WHAT IT DOES:
 * Drive letters, shadow ids, UNC paths and chunk ids are checked once, at
 * construction. Every constructor throws std::invalid_argument on malformed
 * input, so a value that exists is always well-formed.
 *
 * EXAMPLE:
 * DriveLetter letter('z');           // letter.str() == "Z"
 * UncPath share("//fs01/projects/a"); // share.root() == "\\\\fs01\\projects"
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rpl {

class DriveLetter {
public:
    explicit DriveLetter(char letter);
    explicit DriveLetter(std::string_view text);

    [[nodiscard]] char value() const noexcept { return letter_; }
    [[nodiscard]] std::string str() const { return std::string(1, letter_); }

    friend bool operator==(DriveLetter lhs, DriveLetter rhs) noexcept { return lhs.letter_ == rhs.letter_; }
    friend bool operator!=(DriveLetter lhs, DriveLetter rhs) noexcept { return lhs.letter_ != rhs.letter_; }
    friend bool operator<(DriveLetter lhs, DriveLetter rhs) noexcept { return lhs.letter_ < rhs.letter_; }

private:
    char letter_;
};

/**
 * @brief Braced GUID identifying one point-in-time snapshot
 *
 * Canonical form: {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}, lower-case hex.
 */
class ShadowId {
public:
    explicit ShadowId(std::string_view text);

    static ShadowId generate();

    [[nodiscard]] const std::string& str() const noexcept { return value_; }

    /// GUID without braces, usable as a file name
    [[nodiscard]] std::string bare() const { return value_.substr(1, value_.size() - 2); }

    friend bool operator==(const ShadowId& lhs, const ShadowId& rhs) noexcept { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const ShadowId& lhs, const ShadowId& rhs) noexcept { return lhs.value_ != rhs.value_; }

private:
    std::string value_;
};

/**
 * @brief \\server\share[\rest] path
 *
 * Accepts backslash or forward-slash separators and stores the backslash
 * form. Server and share must be non-empty.
 */
class UncPath {
public:
    explicit UncPath(std::string_view text);

    static bool looks_like_unc(std::string_view text) noexcept;

    [[nodiscard]] const std::string& server() const noexcept { return server_; }
    [[nodiscard]] const std::string& share() const noexcept { return share_; }
    [[nodiscard]] const std::string& remainder() const noexcept { return remainder_; }

    /// \\server\share
    [[nodiscard]] std::string root() const;
    /// \\server\share\rest
    [[nodiscard]] std::string str() const;
    /// //server/share/rest, the form mount helpers expect
    [[nodiscard]] std::string posix() const;
    /// rest with '/' separators, empty for the share root
    [[nodiscard]] std::string remainder_posix() const;

    [[nodiscard]] bool same_root(const UncPath& other) const;

private:
    std::string server_;
    std::string share_;
    std::string remainder_; // backslash separated, no leading separator
};

class ChunkId {
public:
    ChunkId() : value_(16, '0') {}
    explicit ChunkId(std::string_view text);

    static ChunkId from_hash(std::uint64_t hash);

    [[nodiscard]] const std::string& str() const noexcept { return value_; }

    friend bool operator==(const ChunkId& lhs, const ChunkId& rhs) noexcept { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const ChunkId& lhs, const ChunkId& rhs) noexcept { return lhs.value_ != rhs.value_; }
    friend bool operator<(const ChunkId& lhs, const ChunkId& rhs) noexcept { return lhs.value_ < rhs.value_; }

private:
    std::string value_;
};

} // namespace rpl

namespace std {

template<>
struct hash<rpl::ChunkId> {
    std::size_t operator()(const rpl::ChunkId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

} // namespace std
