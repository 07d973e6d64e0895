#include "spacepkt/byte_source.hpp"

#include <algorithm>  // std::min, std::copy_n
#include <cerrno>

// Platform headers
#include <unistd.h>

namespace spacepkt {

ReadResult FdByteSource::read(std::span<std::byte> dst) noexcept {
    ReadResult result{};
    if (dst.empty()) {
        result.status = ReadStatus::Ok;
        return result;
    }

    ssize_t n = 0;
    do {
        n = ::read(fd_, dst.data(), dst.size());
    } while (n < 0 && errno == EINTR && (cancel_ == nullptr || !cancel_->load()));

    if (n < 0) {
        result.status = ReadStatus::Error;
        result.error_code = errno;
        return result;
    }

    if (n == 0) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }

    result.status = ReadStatus::Ok;
    result.bytes = static_cast<std::size_t>(n);
    return result;
}

ReadResult MemoryByteSource::read(std::span<std::byte> dst) noexcept {
    ReadResult result{};
    if (dst.empty()) {
        result.status = ReadStatus::Ok;
        return result;
    }

    if (offset_ >= data_.size()) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }

    std::size_t n = std::min(dst.size(), data_.size() - offset_);
    if (max_chunk_ != 0) {
        n = std::min(n, max_chunk_);
    }
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), n, dst.begin());
    offset_ += n;

    result.status = ReadStatus::Ok;
    result.bytes = n;
    return result;
}

ExactReadResult read_exact(ByteSource& source, std::span<std::byte> dst) noexcept {
    ExactReadResult result{};

    while (result.bytes < dst.size()) {
        const ReadResult r = source.read(dst.subspan(result.bytes));

        if (r.status == ReadStatus::Error) {
            result.status = ExactStatus::Error;
            result.error_code = r.error_code;
            return result;
        }

        if (r.status == ReadStatus::EndOfStream || r.bytes == 0) {
            // Only an end before the first byte is a boundary
            result.status = result.bytes == 0 ? ExactStatus::CleanEnd : ExactStatus::Truncated;
            return result;
        }

        result.bytes += r.bytes;
    }

    result.status = ExactStatus::Complete;
    return result;
}

}  // namespace spacepkt
