#include "slicecp/range_partitioner.hpp"

#include <algorithm>
#include <stdexcept>

namespace slicecp {

RangePartitioner::RangePartitioner(std::uint32_t thread_count) : thread_count_(thread_count) {
    if (thread_count_ == 0) {
        throw std::invalid_argument("thread count must be > 0");
    }
}

std::uint32_t RangePartitioner::effective_threads(std::uint64_t size, std::uint32_t thread_count) noexcept {
    const auto bytes = std::max<std::uint64_t>(1, size);
    const auto clamped = std::min<std::uint64_t>(thread_count, bytes);
    return static_cast<std::uint32_t>(std::max<std::uint64_t>(1, clamped));
}

std::vector<Slice> RangePartitioner::partition(std::uint64_t size, std::size_t file_id) const {
    const std::uint32_t count = effective_threads(size, thread_count_);
    const std::uint64_t base = size / count;
    const std::uint64_t remainder = size % count;

    std::vector<Slice> slices;
    slices.reserve(count);
    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint64_t length = base + (i < remainder ? 1 : 0);
        slices.push_back(Slice{file_id, offset, length});
        offset += length;
    }
    return slices;
}

std::uint32_t RangePartitioner::thread_count() const noexcept { return thread_count_; }

} // namespace slicecp
