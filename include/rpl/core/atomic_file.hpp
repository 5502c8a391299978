#pragma once

#include "rpl/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rpl::core {

/**
 * @brief Replace a file's contents so readers never observe a partial write
 *
 * HOW IT WORKS:
 * 1. Write contents to "<path>.tmp-<pid>" next to the target
 * 2. fsync the temp file
 * 3. rename() over the target (atomic on POSIX)
 * 4. fsync the parent directory so the rename itself is durable
 *
 * Parent directories are created when missing. The temp file is removed on
 * any failure.
 */
Result<void> write_file_atomic(const std::filesystem::path& path,
                               std::string_view contents,
                               unsigned permissions = 0644);

/**
 * @brief Read an entire file
 *
 * RETURNS: nullopt when the file does not exist, Io error when it exists
 * but cannot be read.
 */
Result<std::optional<std::string>> read_file(const std::filesystem::path& path);

} // namespace rpl::core
