#include "rpl/core/atomic_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rpl::core {
namespace fs = std::filesystem;
namespace {

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

Result<void> write_all(int fd, std::string_view contents, const fs::path& path) {
    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(ErrorKind::Io, errno_message("Failed to write", path));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return Ok();
}

Result<void> sync_directory(const fs::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to open directory", directory));
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to fsync directory", directory));
    }
    return Ok();
}

} // namespace

Result<void> write_file_atomic(const fs::path& path, std::string_view contents, unsigned permissions) {
    const fs::path parent = path.has_parent_path() ? path.parent_path() : fs::path(".");

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::Io, "Failed to create directory: " + parent.string());
    }

    fs::path temp = path;
    temp += ".tmp-" + std::to_string(::getpid());

    const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                          static_cast<mode_t>(permissions));
    if (fd < 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to create", temp));
    }

    auto written = write_all(fd, contents, temp);
    if (written.is_ok() && ::fsync(fd) != 0) {
        written = Err<void>(ErrorKind::Io, errno_message("Failed to fsync", temp));
    }
    ::close(fd);

    if (written.is_error()) {
        fs::remove(temp, ec);
        return written;
    }

    if (::rename(temp.c_str(), path.c_str()) != 0) {
        auto error = Err<void>(ErrorKind::Io, errno_message("Failed to rename onto", path));
        fs::remove(temp, ec);
        return error;
    }

    return sync_directory(parent);
}

Result<std::optional<std::string>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<std::string>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::optional<std::string>>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(std::optional<std::string>(buffer.str()));
}

} // namespace rpl::core
