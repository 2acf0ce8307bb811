#include "slicecp/command_line.hpp"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace slicecp {

namespace {

constexpr int kCheckSpaceOption = 256;

std::uint32_t parse_threads(const std::string &text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw UsageError("invalid thread count: " + text);
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range &) {
        throw UsageError("thread count out of range: " + text);
    }
    if (value < 1 || value > kMaxThreads) {
        std::ostringstream oss;
        oss << "thread count must be 1-" << kMaxThreads << ": " << text;
        throw UsageError(oss.str());
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

std::optional<std::size_t> parse_size(const std::string &text) {
    std::size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits + 1 < text.size()) {
        return std::nullopt;
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text.substr(0, digits));
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
    unsigned long long multiplier = 1;
    if (digits < text.size()) {
        switch (text[digits]) {
        case 'K':
        case 'k':
            multiplier = 1ull << 10;
            break;
        case 'M':
        case 'm':
            multiplier = 1ull << 20;
            break;
        case 'G':
        case 'g':
            multiplier = 1ull << 30;
            break;
        default:
            return std::nullopt;
        }
    }
    if (value == 0 || value > std::numeric_limits<std::size_t>::max() / multiplier) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value * multiplier);
}

std::string usage(const std::string &program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [OPTIONS] <source> <destination>\n"
        << "\n"
        << "Copy a file, or a directory tree, by copying byte ranges of each file in parallel.\n"
        << "\n"
        << "Options:\n"
        << "  -t, --threads <N>        thread count per file (default 10, max " << kMaxThreads << ")\n"
        << "  -r, --recursive          treat <source> as a directory; copy tree\n"
        << "  -v, --verify             single-file mode only: re-check equality after copy\n"
        << "  -b, --buffer-size <SIZE> per-thread I/O buffer, e.g. 256K, 4M (default 1M, max 256M)\n"
        << "  -q, --quiet              only report errors\n"
        << "      --check-space        fail early when the destination lacks free space\n"
        << "  -h, --help               print this help\n"
        << "  -V, --version            print version\n"
        << "\n"
        << "A failed copy is not rolled back: the destination may be left partially written.\n";
    return oss.str();
}

CommandLine parse_command_line(int argc, char **argv) {
    static const struct option long_opts[] = {{"threads", required_argument, nullptr, 't'},
                                              {"recursive", no_argument, nullptr, 'r'},
                                              {"verify", no_argument, nullptr, 'v'},
                                              {"buffer-size", required_argument, nullptr, 'b'},
                                              {"quiet", no_argument, nullptr, 'q'},
                                              {"check-space", no_argument, nullptr, kCheckSpaceOption},
                                              {"help", no_argument, nullptr, 'h'},
                                              {"version", no_argument, nullptr, 'V'},
                                              {nullptr, 0, nullptr, 0}};

    CommandLine cmd;
    // getopt keeps global state; zero restarts the scan so the parser can run repeatedly.
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, ":t:rvb:qhV", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 't':
            cmd.options.thread_count = parse_threads(optarg);
            break;
        case 'r':
            cmd.options.recursive = true;
            break;
        case 'v':
            cmd.options.verify = true;
            break;
        case 'b': {
            auto size = parse_size(optarg);
            if (!size) {
                throw UsageError(std::string("invalid buffer size: ") + optarg);
            }
            if (*size > kMaxBufferSize) {
                throw UsageError(std::string("buffer size must be at most 256M: ") + optarg);
            }
            cmd.options.buffer_size = *size;
            break;
        }
        case 'q':
            cmd.quiet = true;
            break;
        case kCheckSpaceOption:
            cmd.options.check_space = true;
            break;
        case 'h':
            cmd.show_help = true;
            break;
        case 'V':
            cmd.show_version = true;
            break;
        case ':':
            throw UsageError("option requires an argument");
        default:
            throw UsageError("unknown or incomplete option: " + std::string(argv[optind > 0 ? optind - 1 : 0]));
        }
    }
    if (cmd.show_help || cmd.show_version) {
        return cmd;
    }

    const int remaining = argc - optind;
    if (remaining != 2) {
        throw UsageError("expected <source> <destination> arguments");
    }
    cmd.source = argv[optind];
    cmd.destination = argv[optind + 1];
    return cmd;
}

} // namespace slicecp
