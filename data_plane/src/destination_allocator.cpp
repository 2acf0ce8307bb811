#include "slicecp/destination_allocator.hpp"

#include "slicecp/error.hpp"

namespace slicecp {

DestinationAllocator::DestinationAllocator(FileSystem &fs) : fs_(fs) {}

void DestinationAllocator::allocate(const std::filesystem::path &path, std::uint64_t size) {
    try {
        auto file = fs_.open_write(path, true);
        file->truncate(size);
    } catch (const CopyError &err) {
        if (err.kind() == ErrorKind::DestinationCreateError) {
            throw;
        }
        throw CopyError(ErrorKind::DestinationCreateError, path, err.failure().detail);
    }
}

} // namespace slicecp
