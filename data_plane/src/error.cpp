#include "slicecp/error.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

namespace slicecp {

const char *to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::SourceNotFound:
        return "SourceNotFound";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::DestinationCreateError:
        return "DestinationCreateError";
    case ErrorKind::ReadError:
        return "ReadError";
    case ErrorKind::WriteError:
        return "WriteError";
    case ErrorKind::ShortRead:
        return "ShortRead";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::TraversalError:
        return "TraversalError";
    case ErrorKind::VerificationMismatch:
        return "VerificationMismatch";
    case ErrorKind::InsufficientDiskSpace:
        return "InsufficientDiskSpace";
    }
    return "Unknown";
}

std::string CopyFailure::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": '" << path.string() << "'";
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return oss.str();
}

CopyError::CopyError(CopyFailure failure)
    : std::runtime_error(failure.describe()), failure_(std::move(failure)) {}

CopyError::CopyError(ErrorKind kind, const std::filesystem::path &path, const std::string &detail)
    : CopyError(CopyFailure{kind, path, detail}) {}

CopyError errno_error(ErrorKind kind, const std::filesystem::path &path, const std::string &operation) {
    const int err = errno;
    std::ostringstream oss;
    oss << operation << " failed: " << std::strerror(err);
    return CopyError(kind, path, oss.str());
}

} // namespace slicecp
