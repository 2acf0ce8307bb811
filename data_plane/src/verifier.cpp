#include "slicecp/verifier.hpp"

#include "slicecp/checksum.hpp"
#include "slicecp/error.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace slicecp {

namespace {

// pread may return less than asked before end of file; keep going until the chunk is
// full or the file ends.
std::size_t read_chunk(ReadableFile &file, std::vector<char> &buffer, std::uint64_t offset) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        const std::size_t read = file.read_at(buffer.data() + filled, buffer.size() - filled, offset + filled);
        if (read == 0) {
            break;
        }
        filled += read;
    }
    return filled;
}

std::uint64_t regular_file_size(FileSystem &fs, const std::filesystem::path &path) {
    const auto status = fs.status(path);
    if (status.type == FileType::NotFound) {
        throw CopyError(ErrorKind::SourceNotFound, path, "missing during verification");
    }
    return status.size;
}

} // namespace

Verifier::Verifier(FileSystem &fs, std::size_t chunk_size) : fs_(fs), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("verification chunk size must be > 0");
    }
}

VerificationResult Verifier::verify(const std::filesystem::path &source, const std::filesystem::path &destination) {
    VerificationResult result{source, destination, false, std::nullopt, {}};

    const auto source_size = regular_file_size(fs_, source);
    const auto destination_size = regular_file_size(fs_, destination);
    if (source_size != destination_size) {
        result.mismatch_offset = std::min(source_size, destination_size);
        return result;
    }

    auto source_file = fs_.open_read(source);
    auto destination_file = fs_.open_read(destination);
    const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, std::max<std::uint64_t>(source_size, 1)));
    std::vector<char> source_buffer(chunk);
    std::vector<char> destination_buffer(chunk);
    Crc32 crc;

    std::uint64_t offset = 0;
    while (true) {
        const std::size_t source_read = read_chunk(*source_file, source_buffer, offset);
        const std::size_t destination_read = read_chunk(*destination_file, destination_buffer, offset);
        if (source_read != destination_read ||
            std::memcmp(source_buffer.data(), destination_buffer.data(), source_read) != 0) {
            result.mismatch_offset = offset;
            return result;
        }
        if (source_read == 0) {
            break;
        }
        crc.update(source_buffer.data(), source_read);
        offset += source_read;
    }

    result.identical = true;
    result.crc32_hex = crc.hex();
    return result;
}

} // namespace slicecp
