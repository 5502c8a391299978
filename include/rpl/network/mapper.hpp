#pragma once

#include "rpl/core/config.hpp"
#include "rpl/core/identifiers.hpp"
#include "rpl/core/result.hpp"
#include "rpl/credentials/credential.hpp"
#include "rpl/process/command_runner.hpp"

#include <string>

namespace rpl::network {

/**
 * @brief OS-level drive mapping operations
 *
 * map() returns Conflict when the letter was taken between the in-use
 * check and the mapping attempt; the caller moves on to the next letter.
 * unmap() of a letter that is not mapped succeeds.
 */
class NetworkMapper {
public:
    virtual ~NetworkMapper() = default;

    virtual bool is_letter_in_use(DriveLetter letter) = 0;

    /// Returns the local path the share root is reachable at
    virtual Result<std::string> map(DriveLetter letter,
                                    const UncPath& root,
                                    const credentials::Credential* credential) = 0;

    virtual Result<void> unmap(DriveLetter letter) = 0;
};

/**
 * @brief Linux mapper: one CIFS mount per letter under mount_root
 *
 * Letter Z mounts at "<mount_root>/Z". Credentials reach mount.cifs
 * through its USER and PASSWD environment variables, never the command line.
 */
class CifsNetworkMapper : public NetworkMapper {
public:
    CifsNetworkMapper(core::NetworkConfig config, process::CommandRunner& runner);

    bool is_letter_in_use(DriveLetter letter) override;
    Result<std::string> map(DriveLetter letter,
                            const UncPath& root,
                            const credentials::Credential* credential) override;
    Result<void> unmap(DriveLetter letter) override;

    [[nodiscard]] std::string mount_point(DriveLetter letter) const;

private:
    core::NetworkConfig config_;
    process::CommandRunner& runner_;
};

/// True when path is listed as a mount target in /proc/self/mounts
bool is_mount_point(const std::string& path);

} // namespace rpl::network
