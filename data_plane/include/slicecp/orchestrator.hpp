#pragma once

#include "slicecp/copy_worker_pool.hpp"
#include "slicecp/destination_allocator.hpp"
#include "slicecp/error.hpp"
#include "slicecp/file_system.hpp"
#include "slicecp/range_partitioner.hpp"
#include "slicecp/tree_enumerator.hpp"
#include "slicecp/verifier.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace slicecp {

struct CopyOptions {
    std::uint32_t thread_count = 10;
    bool recursive = false;
    // Honoured for a single top-level file only.
    bool verify = false;
    std::size_t buffer_size = 1u << 20;
    std::size_t verify_chunk_size = Verifier::kDefaultChunkSize;
    // Compare the bytes to copy with the destination's free space before writing.
    bool check_space = false;
};

struct RunReport {
    std::size_t directories_created = 0;
    std::size_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    double elapsed_seconds = 0.0;
    std::optional<VerificationResult> verification;
    std::optional<CopyFailure> error;

    bool ok() const noexcept { return !error.has_value(); }
    int exit_status() const noexcept;
};

// Drives a whole run. A single file is partitioned, allocated, copied by the worker pool
// and optionally verified. A tree is enumerated, its directories are created in plan
// order, then its files are copied one after another. The first failure of any kind ends
// the run; whatever was written before it stays in place.
//
// Sources that cannot be copied as given are reported without touching the destination:
// a missing path is SourceNotFound, a directory without `recursive` is TraversalError
// (the tree would have to be walked), and a FIFO, socket or device is ReadError (only
// regular files can be read by offset).
class Orchestrator {
  public:
    // Throws std::invalid_argument for a zero thread count, buffer size or verification
    // chunk size.
    Orchestrator(FileSystem &fs, CopyOptions options);

    RunReport run(const std::filesystem::path &source, const std::filesystem::path &destination);

    const CopyOptions &options() const noexcept { return options_; }

  private:
    void run_single(const std::filesystem::path &source, std::uint64_t size, std::filesystem::path destination,
                    RunReport &report);
    void run_recursive(const std::filesystem::path &source, const std::filesystem::path &destination,
                       RunReport &report);
    void copy_file(std::size_t file_id, const std::filesystem::path &source, const std::filesystem::path &destination,
                   std::uint64_t size, RunReport &report);
    void ensure_space(const std::filesystem::path &destination, std::uint64_t needed);

    FileSystem &fs_;
    CopyOptions options_;
    RangePartitioner partitioner_;
    DestinationAllocator allocator_;
    CopyWorkerPool pool_;
};

} // namespace slicecp
