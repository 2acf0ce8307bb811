#include "slicecp/error.hpp"
#include "slicecp/tree_enumerator.hpp"

#include "test_support.hpp"

#include <sys/stat.h>

#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <utility>

int main() {
    namespace fs = std::filesystem;
    slicecp_test::TempDir temp("slicecp_tree_test");
    auto src = temp.path() / "src";
    auto dst = temp.path() / "dst";
    fs::create_directories(src / "sub" / "deeper");
    fs::create_directories(src / "z_dir");
    slicecp_test::write_file(src / "a.txt", slicecp_test::pattern_bytes(10, 1));
    slicecp_test::write_file(src / "sub" / "b.txt", slicecp_test::pattern_bytes(20, 2));
    slicecp_test::write_file(src / "sub" / "deeper" / "c.txt", slicecp_test::pattern_bytes(30, 3));
    fs::create_symlink(src / "a.txt", src / "link");
    fs::create_directory_symlink(src / "sub", src / "dirlink");
    int rc = ::mkfifo((src / "fifo").c_str(), 0644);
    assert(rc == 0);

    slicecp::PosixFileSystem posix;
    slicecp::TreeEnumerator enumerator(posix);
    auto plan = enumerator.enumerate(src, dst);

    using Kind = slicecp::PlanEntryKind;
    const std::vector<std::pair<Kind, fs::path>> expected{
        {Kind::Directory, ""},           {Kind::File, "a.txt"},
        {Kind::Directory, "sub"},        {Kind::File, "sub/b.txt"},
        {Kind::Directory, "sub/deeper"}, {Kind::File, "sub/deeper/c.txt"},
        {Kind::Directory, "z_dir"},
    };
    assert(plan.entries.size() == expected.size());
    assert(plan.directory_count() == 4);
    assert(plan.file_count() == 3);
    for (std::size_t i = 0; i < expected.size(); ++i) {
        const auto &entry = plan.entries[i];
        assert(entry.kind == expected[i].first);
        const auto &relative = expected[i].second;
        assert(entry.source == (relative.empty() ? src : src / relative));
        assert(entry.destination == (relative.empty() ? dst : dst / relative));
    }

    // Every entry's parent directory was planned before it.
    std::set<fs::path> planned_directories;
    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
        const auto &entry = plan.entries[i];
        if (i > 0) {
            assert(planned_directories.count(entry.destination.parent_path()) == 1);
        }
        if (entry.kind == Kind::Directory) {
            planned_directories.insert(entry.destination);
        }
    }

    bool threw = false;
    try {
        enumerator.enumerate(temp.path() / "absent", dst);
    } catch (const slicecp::CopyError &err) {
        threw = err.kind() == slicecp::ErrorKind::SourceNotFound;
    }
    assert(threw);

    threw = false;
    try {
        enumerator.enumerate(src / "a.txt", dst);
    } catch (const slicecp::CopyError &err) {
        threw = err.kind() == slicecp::ErrorKind::TraversalError;
    }
    assert(threw);

    slicecp_test::FaultInjectingFileSystem faulty;
    faulty.deny_listing(src / "sub");
    threw = false;
    try {
        slicecp::TreeEnumerator(faulty).enumerate(src, dst);
    } catch (const slicecp::CopyError &err) {
        threw = err.kind() == slicecp::ErrorKind::TraversalError && err.failure().path == src / "sub";
    }
    assert(threw);
    return 0;
}
