#include "rpl/core/identifiers.hpp"
#include "rpl/core/hash.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rpl {
namespace {

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool iequals(const std::string& lhs, const std::string& rhs) {
    return to_lower(lhs) == to_lower(rhs);
}

} // namespace

// ──────────────────────────────────────────────────────────
// DriveLetter
// ──────────────────────────────────────────────────────────

DriveLetter::DriveLetter(char letter) {
    const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    if (upper < 'A' || upper > 'Z') {
        throw std::invalid_argument(std::string("Invalid drive letter: '") + letter + "'");
    }
    letter_ = upper;
}

DriveLetter::DriveLetter(std::string_view text)
    : DriveLetter([text]() {
          // "Z", "Z:" and "Z:\" are all accepted
          std::string_view trimmed = text;
          if (!trimmed.empty() && (trimmed.back() == '\\' || trimmed.back() == '/')) {
              trimmed.remove_suffix(1);
          }
          if (!trimmed.empty() && trimmed.back() == ':') {
              trimmed.remove_suffix(1);
          }
          if (trimmed.size() != 1) {
              throw std::invalid_argument("Invalid drive letter: '" + std::string(text) + "'");
          }
          return trimmed.front();
      }()) {}

// ──────────────────────────────────────────────────────────
// ShadowId
// ──────────────────────────────────────────────────────────

ShadowId::ShadowId(std::string_view text) {
    static constexpr std::size_t kGroupLengths[] = {8, 4, 4, 4, 12};

    std::string_view body = text;
    if (body.size() != 38 || body.front() != '{' || body.back() != '}') {
        throw std::invalid_argument("Invalid shadow id: '" + std::string(text) + "'");
    }
    body = body.substr(1, body.size() - 2);

    std::size_t pos = 0;
    for (std::size_t group = 0; group < 5; ++group) {
        for (std::size_t i = 0; i < kGroupLengths[group]; ++i, ++pos) {
            if (!is_hex(body[pos])) {
                throw std::invalid_argument("Invalid shadow id: '" + std::string(text) + "'");
            }
        }
        if (group < 4) {
            if (body[pos] != '-') {
                throw std::invalid_argument("Invalid shadow id: '" + std::string(text) + "'");
            }
            ++pos;
        }
    }
    value_ = to_lower(text);
}

ShadowId ShadowId::generate() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    const std::uint64_t high = dist(engine);
    const std::uint64_t low = dist(engine);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << '{'
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xffff) << '-'
        << std::setw(4) << (high & 0xffff) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xffffffffffffULL)
        << '}';
    return ShadowId(oss.str());
}

// ──────────────────────────────────────────────────────────
// UncPath
// ──────────────────────────────────────────────────────────

bool UncPath::looks_like_unc(std::string_view text) noexcept {
    return text.size() > 2 &&
           (text[0] == '\\' || text[0] == '/') &&
           (text[1] == '\\' || text[1] == '/');
}

UncPath::UncPath(std::string_view text) {
    if (!looks_like_unc(text)) {
        throw std::invalid_argument("Not a UNC path: '" + std::string(text) + "'");
    }

    std::vector<std::string> parts;
    std::string current;
    for (char c : text.substr(2)) {
        if (c == '\\' || c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(current);
    }

    if (parts.size() < 2) {
        throw std::invalid_argument("UNC path needs server and share: '" + std::string(text) + "'");
    }
    for (const auto& part : parts) {
        if (part == "..") {
            throw std::invalid_argument("UNC path must not contain '..': '" + std::string(text) + "'");
        }
    }

    server_ = parts[0];
    share_ = parts[1];
    for (std::size_t i = 2; i < parts.size(); ++i) {
        if (!remainder_.empty()) {
            remainder_.push_back('\\');
        }
        remainder_ += parts[i];
    }
}

std::string UncPath::root() const {
    return "\\\\" + server_ + "\\" + share_;
}

std::string UncPath::str() const {
    return remainder_.empty() ? root() : root() + "\\" + remainder_;
}

std::string UncPath::posix() const {
    std::string out = "//" + server_ + "/" + share_;
    if (!remainder_.empty()) {
        out += "/" + remainder_posix();
    }
    return out;
}

std::string UncPath::remainder_posix() const {
    std::string out = remainder_;
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

bool UncPath::same_root(const UncPath& other) const {
    return iequals(server_, other.server_) && iequals(share_, other.share_);
}

// ──────────────────────────────────────────────────────────
// ChunkId
// ──────────────────────────────────────────────────────────

ChunkId::ChunkId(std::string_view text) {
    if (text.size() != 16 || !std::all_of(text.begin(), text.end(), is_hex)) {
        throw std::invalid_argument("Invalid chunk id: '" + std::string(text) + "'");
    }
    value_ = to_lower(text);
}

ChunkId ChunkId::from_hash(std::uint64_t hash) {
    return ChunkId(core::hash_to_hex(hash));
}

} // namespace rpl
