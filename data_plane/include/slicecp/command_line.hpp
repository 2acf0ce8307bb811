#pragma once

#include "slicecp/orchestrator.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace slicecp {

inline constexpr const char *kVersion = "0.1.0";
inline constexpr std::uint32_t kMaxThreads = 1024;
// Per thread, so a run may hold kMaxThreads times this much.
inline constexpr std::size_t kMaxBufferSize = 256u << 20;

class UsageError : public std::runtime_error {
  public:
    explicit UsageError(const std::string &msg) : std::runtime_error(msg) {}
};

struct CommandLine {
    CopyOptions options;
    std::filesystem::path source;
    std::filesystem::path destination;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

// Parses `slicecp [OPTIONS] <source> <destination>`. Throws UsageError. Source and
// destination are not required when help or version was requested.
CommandLine parse_command_line(int argc, char **argv);

std::string usage(const std::string &program);

// "512", "64K", "4M", "1G" (binary multiples). Empty for malformed or zero sizes.
std::optional<std::size_t> parse_size(const std::string &text);

} // namespace slicecp
