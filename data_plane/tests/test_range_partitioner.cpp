#include "slicecp/range_partitioner.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

void check_partition(std::uint64_t size, std::uint32_t threads) {
    slicecp::RangePartitioner partitioner(threads);
    auto slices = partitioner.partition(size, 7);
    assert(!slices.empty());
    assert(slices.size() == slicecp::RangePartitioner::effective_threads(size, threads));
    assert(slices.size() <= threads);
    assert(size == 0 || slices.size() <= size);

    std::uint64_t expected_offset = 0;
    std::uint64_t shortest = slices.front().length;
    std::uint64_t longest = slices.front().length;
    for (std::size_t i = 0; i < slices.size(); ++i) {
        assert(slices[i].file_id == 7);
        assert(slices[i].offset == expected_offset);
        if (size > 0) {
            assert(slices[i].length > 0);
        }
        if (i > 0) {
            assert(slices[i].length <= slices[i - 1].length);
        }
        shortest = std::min(shortest, slices[i].length);
        longest = std::max(longest, slices[i].length);
        expected_offset += slices[i].length;
    }
    assert(expected_offset == size);
    assert(longest - shortest <= 1);
}

} // namespace

int main() {
    for (std::uint64_t size = 0; size <= 200; ++size) {
        for (std::uint32_t threads = 1; threads <= 40; ++threads) {
            check_partition(size, threads);
        }
    }
    check_partition(1ull << 40, 10);
    check_partition((1ull << 40) + 3, 1024);
    check_partition(UINT64_MAX, 7);

    auto empty = slicecp::RangePartitioner(10).partition(0);
    assert(empty.size() == 1);
    assert(empty[0].offset == 0 && empty[0].length == 0);

    auto tiny = slicecp::RangePartitioner(100).partition(10);
    assert(tiny.size() == 10);
    for (const auto &slice : tiny) {
        assert(slice.length == 1);
    }

    const std::uint64_t ten_mib = 10ull * 1024 * 1024;
    auto even = slicecp::RangePartitioner(4).partition(ten_mib);
    assert(even.size() == 4);
    for (const auto &slice : even) {
        assert(slice.length == 2621440);
    }

    auto uneven = slicecp::RangePartitioner(4).partition(ten_mib + 2);
    assert(uneven.size() == 4);
    assert(uneven[0].length == 2621441 && uneven[1].length == 2621441);
    assert(uneven[2].length == 2621440 && uneven[3].length == 2621440);
    assert(uneven[3].offset == ten_mib + 2 - 2621440);

    assert(slicecp::RangePartitioner::effective_threads(0, 5) == 1);
    assert(slicecp::RangePartitioner::effective_threads(3, 5) == 3);
    assert(slicecp::RangePartitioner::effective_threads(1000, 5) == 5);

    bool threw = false;
    try {
        slicecp::RangePartitioner zero(0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    return 0;
}
