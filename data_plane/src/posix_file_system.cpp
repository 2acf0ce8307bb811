#include "slicecp/error.hpp"
#include "slicecp/file_system.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>
#include <system_error>

namespace slicecp {

namespace {

class FileDescriptor {
  public:
    explicit FileDescriptor(int fd) : fd_(fd) {}

    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const { return fd_; }

  private:
    int fd_;
};

std::string at_offset(const char *operation, std::uint64_t offset) {
    std::ostringstream oss;
    oss << operation << " at offset " << offset;
    return oss.str();
}

FileType file_type_of(mode_t mode) {
    if (S_ISREG(mode)) {
        return FileType::Regular;
    }
    if (S_ISDIR(mode)) {
        return FileType::Directory;
    }
    if (S_ISLNK(mode)) {
        return FileType::Symlink;
    }
    return FileType::Other;
}

FileType file_type_of(std::filesystem::file_type type) {
    switch (type) {
    case std::filesystem::file_type::regular:
        return FileType::Regular;
    case std::filesystem::file_type::directory:
        return FileType::Directory;
    case std::filesystem::file_type::symlink:
        return FileType::Symlink;
    case std::filesystem::file_type::not_found:
        return FileType::NotFound;
    default:
        return FileType::Other;
    }
}

ErrorKind open_error_kind(int err) {
    if (err == ENOENT || err == ENOTDIR) {
        return ErrorKind::SourceNotFound;
    }
    if (err == EACCES || err == EPERM) {
        return ErrorKind::PermissionDenied;
    }
    return ErrorKind::ReadError;
}

FileStatus stat_path(const std::filesystem::path &path, bool follow_symlinks) {
    struct stat st;
    int rc = follow_symlinks ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return FileStatus{FileType::NotFound, 0};
        }
        throw errno_error(open_error_kind(errno), path, follow_symlinks ? "stat" : "lstat");
    }
    return FileStatus{file_type_of(st.st_mode), static_cast<std::uint64_t>(st.st_size)};
}

class PosixReadableFile : public ReadableFile {
  public:
    explicit PosixReadableFile(const std::filesystem::path &path)
        : path_(path), fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
        if (fd_.get() < 0) {
            throw errno_error(open_error_kind(errno), path_, "open for reading");
        }
    }

    std::size_t read_at(char *buffer, std::size_t length, std::uint64_t offset) override {
        while (true) {
            ssize_t rc = ::pread(fd_.get(), buffer, length, static_cast<off_t>(offset));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw errno_error(ErrorKind::ReadError, path_, at_offset("pread", offset));
            }
            return static_cast<std::size_t>(rc);
        }
    }

  private:
    std::filesystem::path path_;
    FileDescriptor fd_;
};

class PosixWritableFile : public WritableFile {
  public:
    PosixWritableFile(const std::filesystem::path &path, bool create)
        : path_(path), fd_(::open(path.c_str(), O_WRONLY | O_CLOEXEC | (create ? O_CREAT : 0), 0644)) {
        if (fd_.get() < 0) {
            throw errno_error(create ? ErrorKind::DestinationCreateError : ErrorKind::WriteError, path_,
                              "open for writing");
        }
    }

    void write_at(const char *buffer, std::size_t length, std::uint64_t offset) override {
        std::size_t written = 0;
        while (written < length) {
            ssize_t rc = ::pwrite(fd_.get(), buffer + written, length - written,
                                  static_cast<off_t>(offset + written));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw errno_error(ErrorKind::WriteError, path_, at_offset("pwrite", offset + written));
            }
            if (rc == 0) {
                throw CopyError(ErrorKind::WriteError, path_, at_offset("pwrite made no progress", offset + written));
            }
            written += static_cast<std::size_t>(rc);
        }
    }

    void truncate(std::uint64_t size) override {
        if (::ftruncate(fd_.get(), static_cast<off_t>(size)) != 0) {
            throw errno_error(ErrorKind::WriteError, path_, "ftruncate");
        }
    }

  private:
    std::filesystem::path path_;
    FileDescriptor fd_;
};

} // namespace

FileStatus PosixFileSystem::status(const std::filesystem::path &path) { return stat_path(path, true); }

FileStatus PosixFileSystem::symlink_status(const std::filesystem::path &path) { return stat_path(path, false); }

std::unique_ptr<ReadableFile> PosixFileSystem::open_read(const std::filesystem::path &path) {
    return std::make_unique<PosixReadableFile>(path);
}

std::unique_ptr<WritableFile> PosixFileSystem::open_write(const std::filesystem::path &path, bool create) {
    return std::make_unique<PosixWritableFile>(path, create);
}

void PosixFileSystem::create_directory(const std::filesystem::path &path) {
    if (::mkdir(path.c_str(), 0777) == 0) {
        return;
    }
    if (errno == EEXIST) {
        struct stat st;
        if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            return;
        }
        throw CopyError(ErrorKind::DestinationCreateError, path, "exists and is not a directory");
    }
    throw errno_error(ErrorKind::DestinationCreateError, path, "mkdir");
}

std::vector<DirectoryEntry> PosixFileSystem::list_directory(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw CopyError(ErrorKind::TraversalError, path, "cannot open directory: " + ec.message());
    }
    std::vector<DirectoryEntry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto type = it->symlink_status(ec).type();
        if (ec) {
            throw CopyError(ErrorKind::TraversalError, it->path(), "cannot stat entry: " + ec.message());
        }
        entries.push_back(DirectoryEntry{it->path().filename().string(), file_type_of(type)});
    }
    if (ec) {
        throw CopyError(ErrorKind::TraversalError, path, "cannot read directory: " + ec.message());
    }
    return entries;
}

std::uint64_t PosixFileSystem::available_space(const std::filesystem::path &path) {
    struct statvfs st;
    if (::statvfs(path.c_str(), &st) != 0) {
        throw errno_error(ErrorKind::DestinationCreateError, path, "statvfs");
    }
    return static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
}

} // namespace slicecp
