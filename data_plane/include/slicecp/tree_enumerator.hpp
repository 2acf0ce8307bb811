#pragma once

#include "slicecp/file_system.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace slicecp {

enum class PlanEntryKind {
    Directory,
    File,
};

struct PlanEntry {
    PlanEntryKind kind;
    std::filesystem::path source;
    std::filesystem::path destination;
};

// Every Directory entry precedes the entries nested beneath it.
struct DirectoryCopyPlan {
    std::vector<PlanEntry> entries;

    std::size_t directory_count() const noexcept;
    std::size_t file_count() const noexcept;
};

// Depth-first walk of a source tree, siblings in name order. Symbolic links are never
// followed and, like FIFOs, sockets and device nodes, are left out of the plan with a
// warning. Mount points are descended into like any other directory.
// Unreadable directories throw CopyError(TraversalError).
class TreeEnumerator {
  public:
    explicit TreeEnumerator(FileSystem &fs);

    DirectoryCopyPlan enumerate(const std::filesystem::path &source_root,
                                const std::filesystem::path &destination_root);

  private:
    void walk(const std::filesystem::path &source, const std::filesystem::path &destination,
              DirectoryCopyPlan &plan);

    FileSystem &fs_;
};

} // namespace slicecp
