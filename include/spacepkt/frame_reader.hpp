#pragma once

#include "spacepkt/bounded_channel.hpp"
#include "spacepkt/byte_source.hpp"
#include "spacepkt/checksum.hpp"
#include "spacepkt/config.hpp"
#include "spacepkt/decode_error.hpp"
#include "spacepkt/packet.hpp"
#include "spacepkt/primary_header.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace spacepkt {

using PacketChannel = BoundedChannel<Packet>;

// Position of the reader within the current frame
enum class ReaderState : std::uint8_t {
    AwaitingHeader,  // about to read the 6-byte primary header
    AwaitingBody,    // header read, reading data_length + 1 body bytes
    Emit,            // decoding and publishing the packet
    Stopped          // clean end, stop request, or fatal error
};

// Fatal errors for a reader run. None of them is recoverable in-stream:
// the reader never tries to resynchronize after a bad frame.
enum class FrameError : std::uint8_t {
    TruncatedHeader,    // stream ended 1-5 bytes into a header
    TruncatedBody,      // stream ended before the announced body length
    IoError,            // byte source reported a system error
    MalformedHeader,    // header field outside its domain
    DataFieldTooShort,  // body cannot hold the checksum / secondary header
    ChecksumMismatch,   // frame failed checksum validation
    ChannelClosed       // no consumer left to take the packet
};

std::string_view to_string(FrameError error) noexcept;

// Map a packet decode failure to the reader's error space
FrameError to_frame_error(DecodeError error) noexcept;

// Outcome of reading one frame
enum class FrameStatus : std::uint8_t {
    Emitted,      // packet decoded and published
    EndOfStream,  // source exhausted exactly at a header boundary
    Stopped,      // header read interrupted after request_stop()
    Failed        // see error
};

struct FrameResult {
    FrameStatus status = FrameStatus::Failed;
    FrameError error = FrameError::IoError;  // Valid only if status == Failed
    int error_code = 0;                      // errno if error == IoError
};

// Outcome of a whole run
enum class RunStatus : std::uint8_t {
    Completed,  // clean end of stream
    Stopped,    // request_stop() honoured at a header boundary
    Failed      // see error
};

struct RunResult {
    RunStatus status = RunStatus::Failed;
    FrameError error = FrameError::IoError;  // Valid only if status == Failed
    int error_code = 0;                      // errno if error == IoError
};

// Metrics for a reader run
struct ReaderMetrics {
    std::uint64_t frames_read = 0;        // header + body fully read
    std::uint64_t packets_emitted = 0;    // published to the channel
    std::uint64_t bytes_read = 0;         // bytes consumed from the source
    std::uint64_t checksum_failures = 0;
    std::uint64_t truncations = 0;
};

// ============================================================================
// FrameReader
//
// Streams frames off a byte source: read the fixed primary header, derive
// the body length from it, read exactly that many bytes, decode, publish.
//
//   AwaitingHeader --6 bytes--> AwaitingBody --L+1 bytes--> Emit --+
//        ^                                                         |
//        +---------------------------------------------------------+
//   AwaitingHeader --0 bytes--> Stopped (clean)
//   any short read / decode failure / closed channel --> Stopped (fatal)
//
// The source and the channel are borrowed; both must outlive the reader.
// The reader is the channel's only producer and closes it when run() ends,
// so consumers observe end-of-stream instead of blocking forever.
//
// Thread safety: run() belongs to one thread. request_stop() and state()
// may be called from any thread. metrics() should be read after run().
// ============================================================================

class FrameReader {
public:
    FrameReader(ByteSource& source,
                PacketChannel& channel,
                ReaderConfig config = {},
                const ChecksumAccumulator& acc = crc16_ccitt());

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;

    // Read and publish frames until the stream ends, a stop is requested,
    // or an error occurs. Always closes the channel before returning.
    RunResult run();

    // Read, decode and publish a single frame. Does not close the channel.
    FrameResult read_frame();

    // Ask run() to stop before the next header. A frame already in
    // progress is always completed (or fails) first. A header read blocked
    // on an idle source ends only if the source returns EINTR (see
    // FdByteSource cancel).
    void request_stop() noexcept { stop_requested_.store(true); }

    [[nodiscard]] ReaderState state() const noexcept { return state_.load(); }

    [[nodiscard]] const ReaderMetrics& metrics() const noexcept { return metrics_; }

private:
    FrameResult fail(FrameError error, int error_code = 0) noexcept;

    ByteSource& source_;
    PacketChannel& channel_;
    ReaderConfig config_;
    const ChecksumAccumulator& acc_;

    PrimaryHeaderBytes header_{};
    std::vector<std::byte> body_;  // Reusable body buffer

    std::atomic<ReaderState> state_{ReaderState::AwaitingHeader};
    std::atomic<bool> stop_requested_{false};
    ReaderMetrics metrics_;
};

}  // namespace spacepkt
