#include "common/tail_error.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>

namespace backtail {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::FileNotFound:            return "FileNotFound";
    case ErrorKind::PermissionDenied:        return "PermissionDenied";
    case ErrorKind::IOFailure:               return "IOFailure";
    case ErrorKind::DecodeFailure:           return "DecodeFailure";
    case ErrorKind::RotationRecoveryPending: return "RotationRecoveryPending";
    }
    return "Unknown";
}

TailError TailError::from_errno(int err, const std::string& op, const std::string& path)
{
    ErrorKind kind = ErrorKind::IOFailure;
    if (err == ENOENT || err == ENOTDIR) {
        kind = ErrorKind::FileNotFound;
    } else if (err == EACCES || err == EPERM) {
        kind = ErrorKind::PermissionDenied;
    }
    return TailError(kind, fmt::format("{} {}: {}", op, path, std::strerror(err)));
}

} // namespace backtail
