#include "slicecp/tree_enumerator.hpp"

#include "slicecp/error.hpp"
#include "slicecp/log.hpp"

#include <algorithm>

namespace slicecp {

std::size_t DirectoryCopyPlan::directory_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const PlanEntry &entry) {
        return entry.kind == PlanEntryKind::Directory;
    }));
}

std::size_t DirectoryCopyPlan::file_count() const noexcept { return entries.size() - directory_count(); }

TreeEnumerator::TreeEnumerator(FileSystem &fs) : fs_(fs) {}

DirectoryCopyPlan TreeEnumerator::enumerate(const std::filesystem::path &source_root,
                                            const std::filesystem::path &destination_root) {
    FileStatus root{FileType::NotFound, 0};
    try {
        root = fs_.status(source_root);
    } catch (const CopyError &err) {
        throw CopyError(ErrorKind::TraversalError, source_root, err.failure().detail);
    }
    if (root.type == FileType::NotFound) {
        throw CopyError(ErrorKind::SourceNotFound, source_root, "no such directory");
    }
    if (root.type != FileType::Directory) {
        throw CopyError(ErrorKind::TraversalError, source_root, "not a directory");
    }

    DirectoryCopyPlan plan;
    walk(source_root, destination_root, plan);
    return plan;
}

void TreeEnumerator::walk(const std::filesystem::path &source, const std::filesystem::path &destination,
                          DirectoryCopyPlan &plan) {
    plan.entries.push_back(PlanEntry{PlanEntryKind::Directory, source, destination});

    std::vector<DirectoryEntry> children;
    try {
        children = fs_.list_directory(source);
    } catch (const CopyError &err) {
        if (err.kind() == ErrorKind::TraversalError) {
            throw;
        }
        throw CopyError(ErrorKind::TraversalError, source, err.failure().detail);
    }
    std::sort(children.begin(), children.end(),
              [](const DirectoryEntry &a, const DirectoryEntry &b) { return a.name < b.name; });

    for (const auto &child : children) {
        const auto child_source = source / child.name;
        const auto child_destination = destination / child.name;
        switch (child.type) {
        case FileType::Directory:
            walk(child_source, child_destination, plan);
            break;
        case FileType::Regular:
            plan.entries.push_back(PlanEntry{PlanEntryKind::File, child_source, child_destination});
            break;
        case FileType::Symlink:
            log_warning("not following symbolic link: " + child_source.string());
            break;
        case FileType::NotFound:
            throw CopyError(ErrorKind::TraversalError, child_source, "vanished during traversal");
        case FileType::Other:
            log_warning("skipping special file: " + child_source.string());
            break;
        }
    }
}

} // namespace slicecp
