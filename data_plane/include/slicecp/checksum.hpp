#pragma once

#include "slicecp/file_system.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace slicecp {

// Streaming CRC-32 (IEEE 802.3, reflected) used to fingerprint verified content.
class Crc32 {
  public:
    Crc32();

    void update(const char *data, std::size_t size);

    std::uint32_t value() const;

    std::string hex() const;

    static std::uint32_t of(const std::vector<char> &data);

    // Digest of a whole file read in `chunk_size` pieces.
    static std::string file_hex(FileSystem &fs, const std::filesystem::path &path,
                                std::size_t chunk_size = 1u << 20);

  private:
    std::uint32_t crc_;
};

} // namespace slicecp
