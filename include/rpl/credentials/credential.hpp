#pragma once

#include <string>
#include <utility>

namespace rpl::credentials {

/// Overwrite a string's bytes before it is released
void secure_zero(std::string& value) noexcept;

/**
 * @brief User name and secret held only in memory
 *
 * Move-only. The secret is zeroed by clear() and on destruction; a
 * moved-from credential is empty.
 */
class Credential {
public:
    Credential() = default;
    Credential(std::string user, std::string secret)
        : user_(std::move(user)), secret_(std::move(secret)) {}

    ~Credential() { clear(); }

    Credential(const Credential&) = delete;
    Credential& operator=(const Credential&) = delete;

    Credential(Credential&& other) noexcept
        : user_(std::move(other.user_)), secret_(std::move(other.secret_)) {
        other.clear();
    }

    Credential& operator=(Credential&& other) noexcept {
        if (this != &other) {
            clear();
            user_ = std::move(other.user_);
            secret_ = std::move(other.secret_);
            other.clear();
        }
        return *this;
    }

    [[nodiscard]] const std::string& user() const noexcept { return user_; }
    [[nodiscard]] const std::string& secret() const noexcept { return secret_; }
    [[nodiscard]] bool empty() const noexcept { return user_.empty() && secret_.empty(); }

    void clear() noexcept {
        secure_zero(secret_);
        secret_.clear();
        user_.clear();
    }

private:
    std::string user_;
    std::string secret_;
};

} // namespace rpl::credentials
