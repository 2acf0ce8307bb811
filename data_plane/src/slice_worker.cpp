#include "slicecp/slice_worker.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace slicecp {

SliceWorker::SliceWorker(FileSystem &fs, Slice slice, std::filesystem::path source,
                         std::filesystem::path destination, std::size_t buffer_size)
    : fs_(fs), slice_(slice), source_(std::move(source)), destination_(std::move(destination)),
      buffer_size_(buffer_size) {
    if (buffer_size_ == 0) {
        throw std::invalid_argument("buffer size must be > 0");
    }
}

SliceOutcome SliceWorker::run(std::atomic<bool> &cancelled) const {
    SliceOutcome outcome{slice_, 0, std::nullopt};
    if (slice_.length == 0) {
        return outcome;
    }
    bool writing = false;
    try {
        auto reader = fs_.open_read(source_);
        auto writer = fs_.open_write(destination_, false);
        std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(slice_.length, buffer_size_)));

        while (outcome.bytes_copied < slice_.length) {
            if (cancelled.load()) {
                std::ostringstream oss;
                oss << "stopped after " << outcome.bytes_copied << " of " << slice_.length
                    << " bytes at offset " << slice_.offset;
                outcome.error = CopyFailure{ErrorKind::Cancelled, destination_, oss.str()};
                return outcome;
            }
            const std::uint64_t position = slice_.offset + outcome.bytes_copied;
            const auto wanted = static_cast<std::size_t>(
                std::min<std::uint64_t>(slice_.length - outcome.bytes_copied, buffer.size()));
            const std::size_t read = reader->read_at(buffer.data(), wanted, position);
            if (read == 0) {
                std::ostringstream oss;
                oss << "end of file at offset " << position << ", expected " << (slice_.length - outcome.bytes_copied)
                    << " more bytes";
                throw CopyError(ErrorKind::ShortRead, source_, oss.str());
            }
            writing = true;
            writer->write_at(buffer.data(), read, position);
            writing = false;
            outcome.bytes_copied += read;
        }
    } catch (const CopyError &err) {
        outcome.error = err.failure();
        cancelled.store(true);
    } catch (const std::exception &err) {
        // Anything else (allocation failure included) still ends this slice only.
        outcome.error = writing ? CopyFailure{ErrorKind::WriteError, destination_, err.what()}
                                : CopyFailure{ErrorKind::ReadError, source_, err.what()};
        cancelled.store(true);
    }
    return outcome;
}

} // namespace slicecp
