#include "slicecp/orchestrator.hpp"

#include "slicecp/log.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace slicecp {

namespace {

std::filesystem::path existing_ancestor(FileSystem &fs, std::filesystem::path path) {
    while (!path.empty()) {
        if (fs.status(path).type != FileType::NotFound) {
            return path;
        }
        if (path == path.parent_path()) {
            break;
        }
        path = path.parent_path();
    }
    return ".";
}

std::string throughput(std::uint64_t bytes, double seconds) {
    std::ostringstream oss;
    oss << bytes << " bytes written in " << std::fixed << std::setprecision(1) << seconds << " seconds";
    if (seconds > 0.0) {
        oss << " = " << std::setprecision(3) << (static_cast<double>(bytes) / seconds * 8.0 / 1e9) << " Gbits/s";
    }
    return oss.str();
}

} // namespace

int RunReport::exit_status() const noexcept { return ok() ? EXIT_SUCCESS : EXIT_FAILURE; }

Orchestrator::Orchestrator(FileSystem &fs, CopyOptions options)
    : fs_(fs), options_(options), partitioner_(options.thread_count), allocator_(fs),
      pool_(fs, options.buffer_size) {
    if (options_.verify_chunk_size == 0) {
        throw std::invalid_argument("verification chunk size must be > 0");
    }
}

RunReport Orchestrator::run(const std::filesystem::path &source, const std::filesystem::path &destination) {
    RunReport report;
    const auto start = std::chrono::steady_clock::now();
    try {
        const auto status = fs_.status(source);
        if (status.type == FileType::NotFound) {
            throw CopyError(ErrorKind::SourceNotFound, source, "no such file or directory");
        }
        if (status.type == FileType::Directory) {
            if (!options_.recursive) {
                throw CopyError(ErrorKind::TraversalError, source, "is a directory (use --recursive)");
            }
            run_recursive(source, destination, report);
        } else if (status.type == FileType::Regular) {
            run_single(source, status.size, destination, report);
        } else {
            throw CopyError(ErrorKind::ReadError, source, "not a regular file, cannot be read by offset");
        }
    } catch (const CopyError &err) {
        report.error = err.failure();
        log_error(err.what());
        if (err.kind() != ErrorKind::SourceNotFound && err.kind() != ErrorKind::InsufficientDiskSpace) {
            log_error("destination was not rolled back and may be partially written: " + destination.string());
        }
    }
    report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (report.ok()) {
        log_info("Finished! " + throughput(report.bytes_copied, report.elapsed_seconds));
    }
    return report;
}

void Orchestrator::run_single(const std::filesystem::path &source, std::uint64_t size,
                              std::filesystem::path destination, RunReport &report) {
    if (fs_.status(destination).type == FileType::Directory) {
        destination /= source.filename();
    }
    if (options_.check_space) {
        ensure_space(destination, size);
    }
    copy_file(0, source, destination, size, report);

    if (!options_.verify) {
        return;
    }
    log_info("verifying '" + source.string() + "' and '" + destination.string() + "'");
    Verifier verifier(fs_, options_.verify_chunk_size);
    report.verification = verifier.verify(source, destination);
    if (!report.verification->identical) {
        std::ostringstream oss;
        oss << "differs from '" << source.string() << "' in range starting at byte "
            << report.verification->mismatch_offset.value_or(0);
        throw CopyError(ErrorKind::VerificationMismatch, destination, oss.str());
    }
    log_info("verified files are identical, crc32=" + report.verification->crc32_hex);
}

void Orchestrator::run_recursive(const std::filesystem::path &source, const std::filesystem::path &destination,
                                 RunReport &report) {
    if (options_.verify) {
        log_warning("--verify applies to single-file copies only; ignored for a directory tree");
    }
    TreeEnumerator enumerator(fs_);
    const auto plan = enumerator.enumerate(source, destination);
    log_debug("plan for '" + source.string() + "': " + std::to_string(plan.directory_count()) + " directories, " +
              std::to_string(plan.file_count()) + " files");

    if (options_.check_space) {
        std::uint64_t needed = 0;
        for (const auto &entry : plan.entries) {
            if (entry.kind == PlanEntryKind::File) {
                needed += fs_.status(entry.source).size;
            }
        }
        ensure_space(destination, needed);
    }

    for (const auto &entry : plan.entries) {
        if (entry.kind == PlanEntryKind::Directory) {
            fs_.create_directory(entry.destination);
            ++report.directories_created;
        }
    }

    std::size_t file_id = 0;
    for (const auto &entry : plan.entries) {
        if (entry.kind != PlanEntryKind::File) {
            continue;
        }
        const auto status = fs_.status(entry.source);
        if (status.type != FileType::Regular) {
            throw CopyError(ErrorKind::SourceNotFound, entry.source, "changed or removed during copy");
        }
        copy_file(file_id++, entry.source, entry.destination, status.size, report);
    }
}

void Orchestrator::copy_file(std::size_t file_id, const std::filesystem::path &source,
                             const std::filesystem::path &destination, std::uint64_t size, RunReport &report) {
    FileCopyTask task{file_id, source, destination, size, partitioner_.partition(size, file_id)};
    log_debug("copying '" + source.string() + "' -> '" + destination.string() + "', " + std::to_string(size) +
              " bytes in " + std::to_string(task.slices.size()) + " slices");

    // An unreadable source must fail before the destination is created or resized.
    fs_.open_read(source);
    allocator_.allocate(destination, size);
    auto result = pool_.execute(std::move(task));
    report.bytes_copied += result.bytes_copied();
    if (!result.ok()) {
        throw CopyError(*result.first_error);
    }
    ++report.files_copied;
}

void Orchestrator::ensure_space(const std::filesystem::path &destination, std::uint64_t needed) {
    const auto probe = existing_ancestor(fs_, destination.parent_path());
    const auto available = fs_.available_space(probe);
    if (needed > available) {
        std::ostringstream oss;
        oss << needed << " bytes to copy, " << available << " bytes available";
        throw CopyError(ErrorKind::InsufficientDiskSpace, destination, oss.str());
    }
}

} // namespace slicecp
