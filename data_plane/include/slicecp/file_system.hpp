#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace slicecp {

enum class FileType {
    NotFound,
    Regular,
    Directory,
    Symlink,
    Other,
};

struct FileStatus {
    FileType type;
    std::uint64_t size;
};

struct DirectoryEntry {
    std::string name;
    FileType type;
};

class ReadableFile {
  public:
    virtual ~ReadableFile() = default;

    // Reads up to `length` bytes at `offset`. Returns 0 only at end of file.
    virtual std::size_t read_at(char *buffer, std::size_t length, std::uint64_t offset) = 0;
};

class WritableFile {
  public:
    virtual ~WritableFile() = default;

    // Writes all `length` bytes at `offset` or throws.
    virtual void write_at(const char *buffer, std::size_t length, std::uint64_t offset) = 0;

    virtual void truncate(std::uint64_t size) = 0;
};

// Everything the copy engine needs from the filesystem. All failures are reported as
// CopyError; handles are independent so they can be used from different threads.
class FileSystem {
  public:
    virtual ~FileSystem() = default;

    // Follows symbolic links. Returns FileType::NotFound for a missing path.
    virtual FileStatus status(const std::filesystem::path &path) = 0;

    // Does not follow symbolic links.
    virtual FileStatus symlink_status(const std::filesystem::path &path) = 0;

    virtual std::unique_ptr<ReadableFile> open_read(const std::filesystem::path &path) = 0;

    // With `create`, a missing file is created empty; existing content is kept.
    virtual std::unique_ptr<WritableFile> open_write(const std::filesystem::path &path, bool create) = 0;

    // Succeeds when the directory already exists.
    virtual void create_directory(const std::filesystem::path &path) = 0;

    // Entry types are those of the entries themselves, links are not followed.
    virtual std::vector<DirectoryEntry> list_directory(const std::filesystem::path &path) = 0;

    // Bytes available to an unprivileged writer on the filesystem holding `path`.
    virtual std::uint64_t available_space(const std::filesystem::path &path) = 0;
};

class PosixFileSystem : public FileSystem {
  public:
    FileStatus status(const std::filesystem::path &path) override;
    FileStatus symlink_status(const std::filesystem::path &path) override;
    std::unique_ptr<ReadableFile> open_read(const std::filesystem::path &path) override;
    std::unique_ptr<WritableFile> open_write(const std::filesystem::path &path, bool create) override;
    void create_directory(const std::filesystem::path &path) override;
    std::vector<DirectoryEntry> list_directory(const std::filesystem::path &path) override;
    std::uint64_t available_space(const std::filesystem::path &path) override;
};

} // namespace slicecp
