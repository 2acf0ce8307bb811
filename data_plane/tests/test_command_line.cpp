#include "slicecp/command_line.hpp"

#include <cassert>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

class Argv {
  public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto &arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char **argv() { return pointers_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

slicecp::CommandLine parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return slicecp::parse_command_line(argv.argc(), argv.argv());
}

bool rejects(std::initializer_list<std::string> args) {
    try {
        parse(args);
    } catch (const slicecp::UsageError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    auto defaults = parse({"slicecp", "in.bin", "out.bin"});
    assert(defaults.source == "in.bin");
    assert(defaults.destination == "out.bin");
    assert(defaults.options.thread_count == 10);
    assert(!defaults.options.recursive);
    assert(!defaults.options.verify);
    assert(!defaults.options.check_space);
    assert(defaults.options.buffer_size == (1u << 20));
    assert(!defaults.quiet && !defaults.show_help && !defaults.show_version);

    auto full = parse({"slicecp", "-t", "4", "-r", "-v", "--buffer-size", "256K", "-q", "--check-space", "a", "b"});
    assert(full.options.thread_count == 4);
    assert(full.options.recursive && full.options.verify && full.options.check_space);
    assert(full.options.buffer_size == 256u * 1024u);
    assert(full.quiet);

    auto long_form = parse({"slicecp", "src", "dst", "--threads=32", "--recursive", "--verify"});
    assert(long_form.options.thread_count == 32);
    assert(long_form.options.recursive && long_form.options.verify);
    assert(long_form.source == "src" && long_form.destination == "dst");

    assert(parse({"slicecp", "-h"}).show_help);
    assert(parse({"slicecp", "--version"}).show_version);
    assert(parse({"slicecp", "-V"}).show_version);

    assert(rejects({"slicecp"}));
    assert(rejects({"slicecp", "only-source"}));
    assert(rejects({"slicecp", "a", "b", "c"}));
    assert(rejects({"slicecp", "-t", "0", "a", "b"}));
    assert(rejects({"slicecp", "-t", "1025", "a", "b"}));
    assert(rejects({"slicecp", "-t", "-3", "a", "b"}));
    assert(rejects({"slicecp", "-t", "four", "a", "b"}));
    assert(rejects({"slicecp", "-t", "99999999999999999999999", "a", "b"}));
    assert(rejects({"slicecp", "-b", "0", "a", "b"}));
    assert(rejects({"slicecp", "-b", "257M", "a", "b"}));
    assert(rejects({"slicecp", "-b", "1G", "a", "b"}));
    assert(parse({"slicecp", "-b", "256M", "a", "b"}).options.buffer_size == slicecp::kMaxBufferSize);
    assert(rejects({"slicecp", "--bogus", "a", "b"}));
    assert(rejects({"slicecp", "a", "b", "-t"}));

    assert(slicecp::parse_size("512") == 512u);
    assert(slicecp::parse_size("4M") == 4u << 20);
    assert(slicecp::parse_size("1g") == 1u << 30);
    assert(!slicecp::parse_size(""));
    assert(!slicecp::parse_size("M"));
    assert(!slicecp::parse_size("12MB"));
    assert(!slicecp::parse_size("3T"));

    assert(slicecp::usage("slicecp").find("--threads") != std::string::npos);
    return 0;
}
