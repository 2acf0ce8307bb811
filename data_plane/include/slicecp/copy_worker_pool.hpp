#pragma once

#include "slicecp/error.hpp"
#include "slicecp/file_system.hpp"
#include "slicecp/range_partitioner.hpp"
#include "slicecp/slice_worker.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace slicecp {

struct FileCopyTask {
    std::size_t file_id;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t size;
    std::vector<Slice> slices;
};

struct CopyResult {
    FileCopyTask task;
    std::vector<SliceOutcome> outcomes;
    std::optional<CopyFailure> first_error;

    bool ok() const noexcept { return !first_error.has_value(); }
    std::uint64_t bytes_copied() const noexcept;
};

// Runs one SliceWorker per slice of a task, each on its own thread, and folds their
// outcomes into one result. Fail-fast: the first failing worker cancels the others, but
// every worker is joined before `execute` returns.
class CopyWorkerPool {
  public:
    CopyWorkerPool(FileSystem &fs, std::size_t buffer_size);

    // The destination must already have been sized by DestinationAllocator.
    CopyResult execute(FileCopyTask task);

    // Lowest-offset failure other than Cancelled; a Cancelled failure only when nothing
    // else failed. Independent of the order workers finished in.
    static std::optional<CopyFailure> select_first_error(const std::vector<SliceOutcome> &outcomes);

  private:
    FileSystem &fs_;
    std::size_t buffer_size_;
};

} // namespace slicecp
