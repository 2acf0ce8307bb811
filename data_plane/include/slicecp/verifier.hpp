#pragma once

#include "slicecp/file_system.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace slicecp {

struct VerificationResult {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool identical;
    // Start of the first chunk that differs, or the shorter length when sizes differ.
    std::optional<std::uint64_t> mismatch_offset;
    // CRC-32 of the content, set only when identical.
    std::string crc32_hex;
};

// Re-reads source and destination in matching chunks and compares them byte for byte.
// Memory use is two chunks regardless of file size. Read failures throw CopyError.
class Verifier {
  public:
    static constexpr std::size_t kDefaultChunkSize = 10u * 1024u * 1024u;

    explicit Verifier(FileSystem &fs, std::size_t chunk_size = kDefaultChunkSize);

    VerificationResult verify(const std::filesystem::path &source, const std::filesystem::path &destination);

  private:
    FileSystem &fs_;
    std::size_t chunk_size_;
};

} // namespace slicecp
