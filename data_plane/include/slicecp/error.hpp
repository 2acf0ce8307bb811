#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace slicecp {

enum class ErrorKind {
    SourceNotFound,
    PermissionDenied,
    DestinationCreateError,
    ReadError,
    WriteError,
    ShortRead,
    Cancelled,
    TraversalError,
    VerificationMismatch,
    InsufficientDiskSpace,
};

const char *to_string(ErrorKind kind) noexcept;

struct CopyFailure {
    ErrorKind kind;
    std::filesystem::path path;
    std::string detail;

    std::string describe() const;
};

// Thrown by the filesystem layer and the orchestrator. Slice workers turn it into an
// outcome value instead of letting it cross a thread boundary.
class CopyError : public std::runtime_error {
  public:
    explicit CopyError(CopyFailure failure);
    CopyError(ErrorKind kind, const std::filesystem::path &path, const std::string &detail);

    const CopyFailure &failure() const noexcept { return failure_; }
    ErrorKind kind() const noexcept { return failure_.kind; }

  private:
    CopyFailure failure_;
};

// Builds a CopyError from the current errno, prefixed with the failing operation.
CopyError errno_error(ErrorKind kind, const std::filesystem::path &path, const std::string &operation);

} // namespace slicecp
