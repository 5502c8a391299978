#pragma once

#include <string>

namespace rpl {

/**
 * @brief Error taxonomy shared by every module
 *
 * ResourceAcquisition ends a run before copying starts.
 * WorkerFailure is contained by the job manager and retried per policy.
 * ScopeCircuitOpen skips the remaining chunks of one scope only.
 * LedgerCorruption is always recovered locally (ledger treated as empty).
 */
enum class ErrorKind {
    InvalidArgument,
    InvalidConfig,
    Io,
    NotFound,
    Conflict,
    Profiling,
    ResourceAcquisition,
    WorkerFailure,
    ScopeCircuitOpen,
    LedgerCorruption,
    Cancelled
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief "<kind>: <message>" for logs and summaries
 */
std::string describe(const Error& error);

} // namespace rpl
