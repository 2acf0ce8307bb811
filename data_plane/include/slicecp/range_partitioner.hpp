#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace slicecp {

struct Slice {
    std::size_t file_id;
    std::uint64_t offset;
    std::uint64_t length;
};

class RangePartitioner {
  public:
    explicit RangePartitioner(std::uint32_t thread_count);

    // Contiguous, non-overlapping slices covering [0, size) in ascending offset order.
    // Lengths differ by at most one byte; the earliest slices take the remainder.
    std::vector<Slice> partition(std::uint64_t size, std::size_t file_id = 0) const;

    // Number of slices `partition` produces: never more than one per byte, never zero.
    static std::uint32_t effective_threads(std::uint64_t size, std::uint32_t thread_count) noexcept;

    std::uint32_t thread_count() const noexcept;

  private:
    std::uint32_t thread_count_;
};

} // namespace slicecp
