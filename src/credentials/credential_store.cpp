#include "rpl/credentials/credential_store.hpp"
#include "rpl/core/atomic_file.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace rpl::credentials {

namespace fs = std::filesystem;

void secure_zero(std::string& value) noexcept {
    volatile char* bytes = value.data();
    for (std::size_t i = 0; i < value.size(); ++i) {
        bytes[i] = 0;
    }
}

std::string hex_encode(const std::string& bytes) {
    std::ostringstream oss;
    for (unsigned char byte : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

Result<std::string> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err<std::string>(ErrorKind::InvalidArgument, "Hex string has odd length");
    }
    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return Err<std::string>(ErrorKind::InvalidArgument, "Invalid hex digit");
        }
        bytes.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return Ok(std::move(bytes));
}

// ──────────────────────────────────────────────────────────
// CommandSecretProtector
// ──────────────────────────────────────────────────────────

CommandSecretProtector::CommandSecretProtector(core::SecretsConfig config, process::CommandRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

Result<std::string> CommandSecretProtector::transform(const core::CommandTemplate& tmpl,
                                                      const std::string& name,
                                                      const std::string& input,
                                                      const char* action) {
    process::CommandLine command;
    command.argv = process::expand_template(tmpl, {{"name", name}});
    command.input = input;
    command.timeout = config_.command_timeout;
    command.merge_stderr = false;

    auto result = runner_.run(command);
    if (command.input) {
        secure_zero(*command.input);
    }
    if (result.is_error()) {
        return Err<std::string>(result.error());
    }
    if (!result.value().ok()) {
        // Output is not logged: on decrypt it may contain partial plaintext
        return Err<std::string>(ErrorKind::Io,
            std::string("Secret ") + action + " for '" + name + "' failed (exit " +
            std::to_string(result.value().exit_code) + ")");
    }
    return Ok(std::move(result.value().output));
}

Result<std::string> CommandSecretProtector::protect(const std::string& name, const std::string& plaintext) {
    return transform(config_.encrypt, name, plaintext, "encrypt");
}

Result<std::string> CommandSecretProtector::unprotect(const std::string& name, const std::string& blob) {
    return transform(config_.decrypt, name, blob, "decrypt");
}

// ──────────────────────────────────────────────────────────
// CredentialStore
// ──────────────────────────────────────────────────────────

CredentialStore::CredentialStore(fs::path directory, SecretProtector& protector)
    : directory_(std::move(directory)), protector_(protector) {}

fs::path CredentialStore::path_for(const std::string& name) const {
    std::string safe;
    for (char c : name) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        safe.push_back(ok ? c : '_');
    }
    return directory_ / (safe + ".cred.json");
}

Result<void> CredentialStore::store(const std::string& name, const Credential& credential) {
    if (name.empty() || credential.user().empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "Credential needs a name and a user");
    }

    auto blob = protector_.protect(name, credential.secret());
    if (blob.is_error()) {
        return Err<void>(blob.error());
    }

    nlohmann::json document = {
        {"user", credential.user()},
        {"secret", hex_encode(blob.value())}
    };
    auto written = core::write_file_atomic(path_for(name), document.dump(2), 0600);
    if (written.is_error()) {
        return written;
    }
    spdlog::info("[Credentials] Stored '{}' for user {}", name, credential.user());
    return Ok();
}

Result<Credential> CredentialStore::load(const std::string& name) {
    const auto file = path_for(name);
    auto contents = core::read_file(file);
    if (contents.is_error()) {
        return Err<Credential>(contents.error());
    }
    if (!contents.value()) {
        return Err<Credential>(ErrorKind::NotFound, "No stored credential named '" + name + "'");
    }

    auto document = nlohmann::json::parse(*contents.value(), nullptr, false);
    if (document.is_discarded() || !document.is_object() ||
        !document.contains("user") || !document.contains("secret") ||
        !document.at("user").is_string() || !document.at("secret").is_string()) {
        return Err<Credential>(ErrorKind::InvalidConfig, "Malformed credential file: " + file.string());
    }

    auto blob = hex_decode(document.at("secret").get<std::string>());
    if (blob.is_error()) {
        return Err<Credential>(ErrorKind::InvalidConfig, "Malformed credential file: " + file.string());
    }

    auto secret = protector_.unprotect(name, blob.value());
    if (secret.is_error()) {
        return Err<Credential>(secret.error());
    }
    Credential credential(document.at("user").get<std::string>(), std::move(secret.value()));
    secure_zero(secret.value());
    return Ok(std::move(credential));
}

Result<bool> CredentialStore::remove(const std::string& name) {
    std::error_code ec;
    const bool removed = fs::remove(path_for(name), ec);
    if (ec) {
        return Err<bool>(ErrorKind::Io, "Cannot remove credential '" + name + "': " + ec.message());
    }
    return Ok(removed);
}

} // namespace rpl::credentials
