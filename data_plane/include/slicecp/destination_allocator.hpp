#pragma once

#include "slicecp/file_system.hpp"

#include <cstdint>
#include <filesystem>

namespace slicecp {

// Creates `path` if needed and sets its length to exactly `size`. Must complete before any
// slice is written: workers write at arbitrary offsets inside [0, size).
// Throws CopyError(DestinationCreateError).
class DestinationAllocator {
  public:
    explicit DestinationAllocator(FileSystem &fs);

    void allocate(const std::filesystem::path &path, std::uint64_t size);

  private:
    FileSystem &fs_;
};

} // namespace slicecp
