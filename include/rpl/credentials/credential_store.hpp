#pragma once

/**
 * @file credential_store.hpp
 * @brief At-rest credentials for unattended runs
 *
 * WHAT IT DOES:
 * Stores one credential per name as "<dir>/<name>.cred.json":
 *   { "user": "...", "secret": "<hex of protected bytes>" }
 * The secret is always passed through a SecretProtector before it touches
 * disk; plaintext is never written. Files are created with mode 0600.
 *
 * EXAMPLE:
 * CommandSecretProtector protector(config.secrets, runner);
 * CredentialStore store(config.credential_dir(), protector);
 * store.store("fs01", Credential("svc-backup", password));
 * auto credential = store.load("fs01");
 */

#include "rpl/core/config.hpp"
#include "rpl/core/result.hpp"
#include "rpl/credentials/credential.hpp"
#include "rpl/process/command_runner.hpp"

#include <filesystem>
#include <string>

namespace rpl::credentials {

/**
 * @brief Encrypts secrets for storage
 *
 * protect/unprotect must round-trip for the same name on the same host.
 */
class SecretProtector {
public:
    virtual ~SecretProtector() = default;
    virtual Result<std::string> protect(const std::string& name, const std::string& plaintext) = 0;
    virtual Result<std::string> unprotect(const std::string& name, const std::string& blob) = 0;
};

/// Pipes secrets through the configured encrypt/decrypt commands
class CommandSecretProtector : public SecretProtector {
public:
    CommandSecretProtector(core::SecretsConfig config, process::CommandRunner& runner);

    Result<std::string> protect(const std::string& name, const std::string& plaintext) override;
    Result<std::string> unprotect(const std::string& name, const std::string& blob) override;

private:
    Result<std::string> transform(const core::CommandTemplate& tmpl, const std::string& name,
                                  const std::string& input, const char* action);

    core::SecretsConfig config_;
    process::CommandRunner& runner_;
};

class CredentialStore {
public:
    CredentialStore(std::filesystem::path directory, SecretProtector& protector);

    Result<void> store(const std::string& name, const Credential& credential);

    /// NotFound when no credential is stored under name
    Result<Credential> load(const std::string& name);

    /// true if a stored credential was removed
    Result<bool> remove(const std::string& name);

    [[nodiscard]] std::filesystem::path path_for(const std::string& name) const;

private:
    std::filesystem::path directory_;
    SecretProtector& protector_;
};

std::string hex_encode(const std::string& bytes);
Result<std::string> hex_decode(const std::string& hex);

} // namespace rpl::credentials
