#include "slicecp/checksum.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace slicecp {

namespace {

constexpr std::uint32_t kPolynomial = 0xEDB88320u;

constexpr std::array<std::uint32_t, 256> make_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t value = i;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1u) ? (value >> 1) ^ kPolynomial : value >> 1;
        }
        table[i] = value;
    }
    return table;
}

constexpr auto kTable = make_table();

} // namespace

Crc32::Crc32() : crc_(0xFFFFFFFFu) {}

void Crc32::update(const char *data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        const auto byte = static_cast<unsigned char>(data[i]);
        crc_ = (crc_ >> 8) ^ kTable[(crc_ ^ byte) & 0xFFu];
    }
}

std::uint32_t Crc32::value() const { return crc_ ^ 0xFFFFFFFFu; }

std::string Crc32::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << value();
    return oss.str();
}

std::uint32_t Crc32::of(const std::vector<char> &data) {
    Crc32 crc;
    crc.update(data.data(), data.size());
    return crc.value();
}

std::string Crc32::file_hex(FileSystem &fs, const std::filesystem::path &path, std::size_t chunk_size) {
    auto file = fs.open_read(path);
    std::vector<char> buffer(chunk_size == 0 ? 4096 : chunk_size);
    Crc32 crc;
    std::uint64_t offset = 0;
    while (true) {
        const std::size_t read = file->read_at(buffer.data(), buffer.size(), offset);
        if (read == 0) {
            break;
        }
        crc.update(buffer.data(), read);
        offset += read;
    }
    return crc.hex();
}

} // namespace slicecp
