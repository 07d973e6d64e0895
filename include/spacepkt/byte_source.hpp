#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace spacepkt {

// Result status for a single read
enum class ReadStatus : std::uint8_t {
    Ok,           // At least one byte read
    EndOfStream,  // Source exhausted, nothing read
    Error         // System error during read
};

struct ReadResult {
    ReadStatus status = ReadStatus::Error;
    std::size_t bytes = 0;   // Valid only if status == Ok
    int error_code = 0;      // errno if status == Error
};

// ============================================================================
// ByteSource Interface
//
// Sequential, ordered producer of bytes. Opening and closing the underlying
// resource is the caller's business.
//
// Contract:
// - read() blocks until at least one byte is available or the stream ends
// - read() may return fewer bytes than requested
// - Should not throw
// ============================================================================

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to dst.size() bytes into dst.
    [[nodiscard]] virtual ReadResult read(std::span<std::byte> dst) noexcept = 0;
};

// ============================================================================
// FdByteSource: POSIX file descriptor (stdin, pipe, file, stream socket)
//
// Does NOT close fd on destruction (caller manages lifetime).
// A read interrupted by a signal is retried, unless cancel is set: then it
// returns Error with EINTR. Install the handler without SA_RESTART.
// ============================================================================

class FdByteSource final : public ByteSource {
public:
    explicit FdByteSource(int fd, const std::atomic<bool>* cancel = nullptr) noexcept
        : fd_(fd)
        , cancel_(cancel) {}

    [[nodiscard]] ReadResult read(std::span<std::byte> dst) noexcept override;

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
    const std::atomic<bool>* cancel_;
};

// ============================================================================
// MemoryByteSource: in-memory buffer (for tests and replay)
//
// max_chunk bounds the bytes handed out per read (0 = unbounded), which
// lets tests exercise short reads.
// ============================================================================

class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::byte> data, std::size_t max_chunk = 0)
        : data_(std::move(data))
        , max_chunk_(max_chunk) {}

    [[nodiscard]] ReadResult read(std::span<std::byte> dst) noexcept override;

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    std::vector<std::byte> data_;
    std::size_t max_chunk_;
    std::size_t offset_ = 0;
};

// Outcome of filling a buffer completely
enum class ExactStatus : std::uint8_t {
    Complete,   // dst fully populated
    CleanEnd,   // stream ended before the first byte
    Truncated,  // stream ended part-way through dst
    Error       // system error
};

struct ExactReadResult {
    ExactStatus status = ExactStatus::Error;
    std::size_t bytes = 0;   // bytes placed in dst
    int error_code = 0;      // errno if status == Error
};

// Read exactly dst.size() bytes, looping over short reads.
ExactReadResult read_exact(ByteSource& source, std::span<std::byte> dst) noexcept;

}  // namespace spacepkt
