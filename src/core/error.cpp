#include "rpl/core/error.hpp"

namespace rpl {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::Io: return "Io";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::Profiling: return "Profiling";
        case ErrorKind::ResourceAcquisition: return "ResourceAcquisition";
        case ErrorKind::WorkerFailure: return "WorkerFailure";
        case ErrorKind::ScopeCircuitOpen: return "ScopeCircuitOpen";
        case ErrorKind::LedgerCorruption: return "LedgerCorruption";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace rpl
