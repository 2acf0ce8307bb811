#include "slicecp/copy_worker_pool.hpp"

#include "slicecp/log.hpp"

#include <atomic>
#include <future>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace slicecp {

std::uint64_t CopyResult::bytes_copied() const noexcept {
    std::uint64_t total = 0;
    for (const auto &outcome : outcomes) {
        total += outcome.bytes_copied;
    }
    return total;
}

CopyWorkerPool::CopyWorkerPool(FileSystem &fs, std::size_t buffer_size) : fs_(fs), buffer_size_(buffer_size) {
    if (buffer_size_ == 0) {
        throw std::invalid_argument("buffer size must be > 0");
    }
}

CopyResult CopyWorkerPool::execute(FileCopyTask task) {
    std::atomic<bool> cancelled{false};
    std::vector<std::future<SliceOutcome>> futures;
    std::vector<std::thread> threads;
    futures.reserve(task.slices.size());
    threads.reserve(task.slices.size());

    auto join_all = [&threads] {
        for (auto &thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };

    try {
        for (const auto &slice : task.slices) {
            SliceWorker worker(fs_, slice, task.source, task.destination, buffer_size_);
            std::packaged_task<SliceOutcome()> job([worker, &cancelled] { return worker.run(cancelled); });
            futures.push_back(job.get_future());
            threads.emplace_back(std::move(job));
        }
    } catch (const std::system_error &) {
        cancelled.store(true);
        join_all();
        throw;
    }
    join_all();

    CopyResult result{std::move(task), {}, std::nullopt};
    result.outcomes.reserve(futures.size());
    for (auto &future : futures) {
        result.outcomes.push_back(future.get());
    }

    result.first_error = select_first_error(result.outcomes);
    if (result.ok() && result.bytes_copied() != result.task.size) {
        std::ostringstream oss;
        oss << "slices of '" << result.task.source.string() << "' copied " << result.bytes_copied()
            << " bytes, expected " << result.task.size;
        throw std::logic_error(oss.str());
    }
    if (!result.ok()) {
        log_debug("slice copy of '" + result.task.source.string() + "' failed: " + result.first_error->describe());
    }
    return result;
}

std::optional<CopyFailure> CopyWorkerPool::select_first_error(const std::vector<SliceOutcome> &outcomes) {
    const SliceOutcome *first = nullptr;
    const SliceOutcome *first_cancelled = nullptr;
    for (const auto &outcome : outcomes) {
        if (outcome.ok()) {
            continue;
        }
        auto &candidate = outcome.error->kind == ErrorKind::Cancelled ? first_cancelled : first;
        if (candidate == nullptr || outcome.slice.offset < candidate->slice.offset) {
            candidate = &outcome;
        }
    }
    if (first != nullptr) {
        return first->error;
    }
    if (first_cancelled != nullptr) {
        return first_cancelled->error;
    }
    return std::nullopt;
}

} // namespace slicecp
