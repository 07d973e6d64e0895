#include "spacepkt/frame_reader.hpp"

#include <cerrno>
#include <utility>
#include <variant>

namespace spacepkt {

std::string_view to_string(FrameError error) noexcept {
    switch (error) {
        case FrameError::TruncatedHeader:
            return "truncated_header";
        case FrameError::TruncatedBody:
            return "truncated_body";
        case FrameError::IoError:
            return "io_error";
        case FrameError::MalformedHeader:
            return "malformed_header";
        case FrameError::DataFieldTooShort:
            return "data_field_too_short";
        case FrameError::ChecksumMismatch:
            return "checksum_mismatch";
        case FrameError::ChannelClosed:
            return "channel_closed";
    }
    return "unknown";
}

FrameError to_frame_error(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::DataFieldTooShort:
            return FrameError::DataFieldTooShort;
        case DecodeError::HeaderSizeMismatch:
        case DecodeError::DataFieldTooLong:
            // Not produced by decoding a 6-byte header and its announced body
        case DecodeError::MalformedHeader:
            return FrameError::MalformedHeader;
        case DecodeError::ChecksumMismatch:
            return FrameError::ChecksumMismatch;
    }
    return FrameError::MalformedHeader;
}

FrameReader::FrameReader(ByteSource& source,
                         PacketChannel& channel,
                         ReaderConfig config,
                         const ChecksumAccumulator& acc)
    : source_(source)
    , channel_(channel)
    , config_(config)
    , acc_(acc) {
    body_.reserve(config_.buffer_bytes);
}

RunResult FrameReader::run() {
    RunResult result{};

    while (true) {
        if (stop_requested_.load()) {
            state_ = ReaderState::Stopped;
            result.status = RunStatus::Stopped;
            break;
        }

        const FrameResult frame = read_frame();

        if (frame.status == FrameStatus::EndOfStream) {
            result.status = RunStatus::Completed;
            break;
        }

        if (frame.status == FrameStatus::Stopped) {
            result.status = RunStatus::Stopped;
            break;
        }

        if (frame.status == FrameStatus::Failed) {
            result.status = RunStatus::Failed;
            result.error = frame.error;
            result.error_code = frame.error_code;
            break;
        }
    }

    channel_.close();
    return result;
}

FrameResult FrameReader::read_frame() {
    // Header: only a read that ends before the first byte is a clean end
    state_ = ReaderState::AwaitingHeader;
    const ExactReadResult header_read = read_exact(source_, header_);
    metrics_.bytes_read += header_read.bytes;

    switch (header_read.status) {
        case ExactStatus::Complete:
            break;
        case ExactStatus::CleanEnd:
            state_ = ReaderState::Stopped;
            return FrameResult{ .status = FrameStatus::EndOfStream };
        case ExactStatus::Truncated:
            ++metrics_.truncations;
            return fail(FrameError::TruncatedHeader);
        case ExactStatus::Error:
            // Signal woke an idle read to deliver a stop: still a boundary
            if (header_read.bytes == 0 && header_read.error_code == EINTR &&
                stop_requested_.load()) {
                state_ = ReaderState::Stopped;
                return FrameResult{ .status = FrameStatus::Stopped };
            }
            return fail(FrameError::IoError, header_read.error_code);
    }

    // Body: data_length + 1 bytes, all of which must arrive
    state_ = ReaderState::AwaitingBody;
    body_.resize(body_length(header_));
    const ExactReadResult body_read = read_exact(source_, body_);
    metrics_.bytes_read += body_read.bytes;

    switch (body_read.status) {
        case ExactStatus::Complete:
            break;
        case ExactStatus::CleanEnd:
        case ExactStatus::Truncated:
            ++metrics_.truncations;
            return fail(FrameError::TruncatedBody);
        case ExactStatus::Error:
            return fail(FrameError::IoError, body_read.error_code);
    }
    ++metrics_.frames_read;

    state_ = ReaderState::Emit;
    PacketResult decoded = Packet::from_buffers(header_, body_, acc_);
    if (const auto* err = std::get_if<DecodeError>(&decoded)) {
        if (*err == DecodeError::ChecksumMismatch) {
            ++metrics_.checksum_failures;
        }
        return fail(to_frame_error(*err));
    }

    if (channel_.push(std::move(std::get<Packet>(decoded))) != PushResult::Ok) {
        return fail(FrameError::ChannelClosed);
    }
    ++metrics_.packets_emitted;

    state_ = ReaderState::AwaitingHeader;
    return FrameResult{ .status = FrameStatus::Emitted };
}

FrameResult FrameReader::fail(FrameError error, int error_code) noexcept {
    state_ = ReaderState::Stopped;
    return FrameResult{
        .status = FrameStatus::Failed,
        .error = error,
        .error_code = error_code,
    };
}

}  // namespace spacepkt
