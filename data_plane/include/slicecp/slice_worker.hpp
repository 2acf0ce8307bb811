#pragma once

#include "slicecp/error.hpp"
#include "slicecp/file_system.hpp"
#include "slicecp/range_partitioner.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace slicecp {

struct SliceOutcome {
    Slice slice;
    std::uint64_t bytes_copied;
    std::optional<CopyFailure> error;

    bool ok() const noexcept { return !error.has_value(); }
};

// Copies one slice with its own source and destination handles. The destination must
// already span the slice (see DestinationAllocator). The cancellation flag is checked
// before every chunk; a worker that fails raises it so its siblings stop early.
class SliceWorker {
  public:
    SliceWorker(FileSystem &fs, Slice slice, std::filesystem::path source, std::filesystem::path destination,
                std::size_t buffer_size);

    SliceOutcome run(std::atomic<bool> &cancelled) const;

  private:
    FileSystem &fs_;
    Slice slice_;
    std::filesystem::path source_;
    std::filesystem::path destination_;
    std::size_t buffer_size_;
};

} // namespace slicecp
