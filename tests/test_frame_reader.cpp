#include "spacepkt/frame_reader.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace {

using spacepkt::FrameError;
using spacepkt::MemoryByteSource;
using spacepkt::Packet;
using spacepkt::PacketChannel;
using spacepkt::RunStatus;

std::vector<std::byte> to_bytes(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(std::byte(v));
    }
    return out;
}

void append(std::vector<std::byte>& dst, const std::vector<std::byte>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

// Telemetry frame with secondary header (6 + 16 bytes)
const std::vector<std::byte> kValidFrame = to_bytes({
    0x08, 0x73, 0xC1, 0x23, 0x00, 0x0F,
    0x00, 0x00, 0x12, 0x34, 0x00, 0xAB, 0xCD, 0xEF,
    0xA5, 0xA5, 0x5A, 0x5A, 0xC3, 0x3C, 0xC1, 0xF8,
});

// Telecommand frame without secondary header (6 + 5 bytes)
const std::vector<std::byte> kValidFrame2 = to_bytes({
    0x17, 0x54, 0xC6, 0x82, 0x00, 0x04,
    0x01, 0x02, 0x00, 0x2D, 0xDD,
});

// A frame whose sequence counter identifies it
std::vector<std::byte> make_frame(std::uint16_t counter, std::size_t payload_size) {
    spacepkt::PrimaryHeader primary{};
    primary.apid = 0x0123;
    primary.sequence_flags = 0x03;
    primary.sequence_counter = counter;

    std::optional<spacepkt::SecondaryHeader> secondary;
    if ((counter % 2) == 0) {
        secondary = spacepkt::SecondaryHeader{ .time_week = counter, .time_ms = 1000u * counter };
    }
    std::optional<spacepkt::UserDataField> user_data;
    if (payload_size > 0) {
        user_data = spacepkt::UserDataField{
            std::vector<std::byte>(payload_size, std::byte(counter & 0xFF)) };
    }
    return std::get<Packet>(Packet::create(primary, secondary, user_data)).to_buffer();
}

// Fails every read with a fixed errno
class ErrorByteSource final : public spacepkt::ByteSource {
public:
    [[nodiscard]] spacepkt::ReadResult read(std::span<std::byte> /*dst*/) noexcept override {
        return spacepkt::ReadResult{ .status = spacepkt::ReadStatus::Error, .error_code = EIO };
    }
};

bool test_single_frame() {
    MemoryByteSource source(kValidFrame);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Completed) return false;
    if (!channel.closed()) return false;

    auto pkt = channel.pop();
    if (!pkt) return false;

    const auto frame = pkt->to_buffers();
    if (frame.header != to_bytes({0x08, 0x73, 0xC1, 0x23, 0x00, 0x0F})) return false;
    if (frame.data != to_bytes({0x00, 0x00, 0x12, 0x34, 0x00, 0xAB, 0xCD, 0xEF,
                                0xA5, 0xA5, 0x5A, 0x5A, 0xC3, 0x3C, 0xC1, 0xF8})) {
        return false;
    }

    // Exactly one packet, then end-of-stream
    if (channel.pop().has_value()) return false;

    const auto& m = reader.metrics();
    if (m.frames_read != 1 || m.packets_emitted != 1) return false;
    if (m.bytes_read != kValidFrame.size()) return false;
    if (reader.state() != spacepkt::ReaderState::Stopped) return false;

    return true;
}

bool test_empty_source_is_clean_end() {
    MemoryByteSource source(std::vector<std::byte>{});
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Completed) return false;
    if (channel.pop().has_value()) return false;
    return reader.metrics().packets_emitted == 0;
}

bool test_truncated_header() {
    for (std::size_t n = 1; n < spacepkt::kPrimaryHeaderSize; ++n) {
        std::vector<std::byte> data(kValidFrame.begin(), kValidFrame.begin() + n);
        MemoryByteSource source(data);
        PacketChannel channel(4);
        spacepkt::FrameReader reader(source, channel);

        auto result = reader.run();
        if (result.status != RunStatus::Failed) return false;
        if (result.error != FrameError::TruncatedHeader) {
            std::printf("%zu header bytes: expected truncated_header, got %s\n", n,
                        std::string(spacepkt::to_string(result.error)).c_str());
            return false;
        }
        if (!channel.closed() || channel.pop().has_value()) return false;
    }
    return true;
}

// Header complete, body cut short
bool test_truncated_body() {
    const auto data = to_bytes({0x08, 0x73, 0xC1, 0x23, 0x00, 0x0F, 0x00, 0x00});
    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Failed) return false;
    if (result.error != FrameError::TruncatedBody) return false;
    if (reader.metrics().truncations != 1) return false;
    return !channel.pop().has_value();
}

// Header alone with no body bytes at all is still a truncation
bool test_header_without_body() {
    const auto data = to_bytes({0x17, 0x54, 0xC6, 0x82, 0x00, 0x04});
    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    return result.status == RunStatus::Failed && result.error == FrameError::TruncatedBody;
}

// Complete frames followed by a partial header: packets before it are kept
bool test_trailing_partial_header() {
    std::vector<std::byte> data = kValidFrame;
    append(data, kValidFrame2);
    data.push_back(std::byte{0x08});
    data.push_back(std::byte{0x73});

    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Failed) return false;
    if (result.error != FrameError::TruncatedHeader) return false;

    if (channel.size() != 2) return false;
    auto first = channel.pop();
    auto second = channel.pop();
    if (!first || first->primary_header().apid != 0x0073) return false;
    if (!second || second->primary_header().apid != 0x0754) return false;
    return !channel.pop().has_value();
}

bool test_two_frames_then_clean_end() {
    std::vector<std::byte> data = kValidFrame;
    append(data, kValidFrame2);

    // Deliver one byte per read to exercise short reads
    MemoryByteSource source(data, 1);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Completed) return false;

    auto first = channel.pop();
    auto second = channel.pop();
    if (!first || first->checksum() != 0xC1F8) return false;
    if (!second || second->checksum() != 0x2DDD) return false;
    if (second->primary_header().packet_type != spacepkt::PacketType::Telecommand) return false;

    return reader.metrics().bytes_read == data.size();
}

bool test_checksum_failure_is_fatal() {
    std::vector<std::byte> data = kValidFrame2;
    std::vector<std::byte> bad = kValidFrame;
    bad[bad.size() - 1] ^= std::byte{0x01};
    append(data, bad);
    append(data, kValidFrame2);  // never reached: no resync

    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Failed) return false;
    if (result.error != FrameError::ChecksumMismatch) return false;
    if (reader.metrics().checksum_failures != 1) return false;
    if (reader.metrics().frames_read != 2) return false;

    // Only the frame before the bad one was published
    if (channel.size() != 1) return false;
    auto pkt = channel.pop();
    if (!pkt || pkt->checksum() != 0x2DDD) return false;
    return !channel.pop().has_value();
}

// data_length = 0 announces a 1-byte body: no room for the checksum
bool test_body_too_short_for_checksum() {
    const auto data = to_bytes({0x17, 0x54, 0xC6, 0x82, 0x00, 0x00, 0xAA});
    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    return result.status == RunStatus::Failed && result.error == FrameError::DataFieldTooShort;
}

bool test_io_error() {
    ErrorByteSource source;
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Failed) return false;
    if (result.error != FrameError::IoError) return false;
    if (result.error_code != EIO) return false;
    return channel.closed();
}

bool test_channel_closed_by_consumer() {
    MemoryByteSource source(kValidFrame);
    PacketChannel channel(4);
    channel.close();
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Failed) return false;
    if (result.error != FrameError::ChannelClosed) return false;
    return reader.metrics().packets_emitted == 0;
}

bool test_stop_before_run() {
    MemoryByteSource source(kValidFrame);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    reader.request_stop();
    auto result = reader.run();
    if (result.status != RunStatus::Stopped) return false;
    if (reader.state() != spacepkt::ReaderState::Stopped) return false;
    if (!channel.closed()) return false;

    // Nothing consumed from the source
    return source.remaining() == kValidFrame.size() && !channel.pop().has_value();
}

// Decode failures keep their meaning; none reads as a truncation
bool test_decode_error_mapping() {
    using spacepkt::DecodeError;
    using spacepkt::to_frame_error;

    if (to_frame_error(DecodeError::DataFieldTooShort) != FrameError::DataFieldTooShort) return false;
    if (to_frame_error(DecodeError::ChecksumMismatch) != FrameError::ChecksumMismatch) return false;
    if (to_frame_error(DecodeError::MalformedHeader) != FrameError::MalformedHeader) return false;
    if (to_frame_error(DecodeError::HeaderSizeMismatch) != FrameError::MalformedHeader) return false;
    return to_frame_error(DecodeError::DataFieldTooLong) == FrameError::MalformedHeader;
}

void on_wake_signal(int /*signum*/) {}

// A stop reaches a reader blocked on a silent pipe once a signal interrupts it
bool test_stop_interrupts_idle_read() {
    int fds[2];
    if (pipe(fds) != 0) {
        std::printf("pipe() failed\n");
        return false;
    }

    struct sigaction sa {};
    sa.sa_handler = on_wake_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    struct sigaction previous {};
    if (sigaction(SIGUSR1, &sa, &previous) != 0) {
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    std::atomic<bool> interrupted{false};
    spacepkt::FdByteSource source(fds[0], &interrupted);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    std::atomic<bool> done{false};
    spacepkt::RunResult result{};
    std::thread worker([&] {
        result = reader.run();
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    interrupted = true;
    reader.request_stop();
    while (!done.load()) {
        pthread_kill(worker.native_handle(), SIGUSR1);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    worker.join();

    sigaction(SIGUSR1, &previous, nullptr);
    close(fds[0]);
    close(fds[1]);

    if (result.status != RunStatus::Stopped) return false;
    if (reader.state() != spacepkt::ReaderState::Stopped) return false;
    return channel.closed() && reader.metrics().bytes_read == 0;
}

bool test_read_frame_steps() {
    std::vector<std::byte> data = kValidFrame;
    append(data, kValidFrame2);

    MemoryByteSource source(data);
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    if (reader.read_frame().status != spacepkt::FrameStatus::Emitted) return false;
    if (reader.state() != spacepkt::ReaderState::AwaitingHeader) return false;
    if (reader.read_frame().status != spacepkt::FrameStatus::Emitted) return false;
    if (reader.read_frame().status != spacepkt::FrameStatus::EndOfStream) return false;

    // read_frame leaves the channel open
    return !channel.closed() && channel.size() == 2;
}

// Many frames through a small channel with a concurrent consumer
bool test_ordering_with_concurrent_consumer() {
    constexpr std::uint16_t kFrames = 500;

    std::vector<std::byte> data;
    for (std::uint16_t i = 0; i < kFrames; ++i) {
        append(data, make_frame(i, i % 37));
    }

    MemoryByteSource source(data, 7);
    PacketChannel channel(4);  // forces the reader to block on a full channel
    spacepkt::FrameReader reader(source, channel);

    spacepkt::RunResult result{};
    std::thread producer([&] { result = reader.run(); });

    std::uint16_t expected = 0;
    bool ok = true;
    while (auto pkt = channel.pop()) {
        const auto& h = pkt->primary_header();
        if (h.sequence_counter != expected) {
            std::printf("Expected counter %u, got %u\n", static_cast<unsigned>(expected),
                        static_cast<unsigned>(h.sequence_counter));
            ok = false;
        }
        const std::size_t payload = pkt->user_data() ? pkt->user_data()->size() : 0;
        if (payload != expected % 37u) ok = false;
        if (pkt->secondary_header().has_value() != ((expected % 2) == 0)) ok = false;
        ++expected;
    }
    producer.join();

    if (!ok) return false;
    if (result.status != RunStatus::Completed) return false;
    if (expected != kFrames) {
        std::printf("Expected %u packets, got %u\n", static_cast<unsigned>(kFrames),
                    static_cast<unsigned>(expected));
        return false;
    }
    return reader.metrics().packets_emitted == kFrames;
}

// Largest announced body (data_length = 0xFFFF)
bool test_maximum_frame() {
    const std::size_t payload = spacepkt::kDataFieldMaxSize - spacepkt::kChecksumSize;

    spacepkt::PrimaryHeader primary{};
    primary.apid = 0x07FF;

    auto created = Packet::create(primary, std::nullopt,
                                  spacepkt::UserDataField{ std::vector<std::byte>(payload, std::byte{0x5A}) });
    const auto* original = std::get_if<Packet>(&created);
    if (original == nullptr || original->primary_header().data_length != 0xFFFF) return false;

    MemoryByteSource source(original->to_buffer());
    PacketChannel channel(1);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Completed) return false;

    auto pkt = channel.pop();
    return pkt && *pkt == *original;
}

// A packet built with a stale flag and length still reads back
bool test_created_packet_reads_back() {
    spacepkt::PrimaryHeader primary{};
    primary.apid = 0x0200;
    primary.secondary_header_flag = false;
    primary.data_length = 1;

    auto created = Packet::create(primary, spacepkt::SecondaryHeader{ .time_week = 1, .time_ms = 2 },
                                  spacepkt::UserDataField{ to_bytes({0x01, 0x02, 0x03, 0x04}) });
    const auto* original = std::get_if<Packet>(&created);
    if (original == nullptr) return false;

    MemoryByteSource source(original->to_buffer());
    PacketChannel channel(4);
    spacepkt::FrameReader reader(source, channel);

    auto result = reader.run();
    if (result.status != RunStatus::Completed) {
        std::printf("run failed: %s\n", std::string(spacepkt::to_string(result.error)).c_str());
        return false;
    }

    auto pkt = channel.pop();
    return pkt && *pkt == *original && pkt->secondary_header().has_value();
}

}  // namespace

int main() {
    if (!test_single_frame()) {
        std::printf("test_single_frame failed\n");
        return EXIT_FAILURE;
    }

    if (!test_empty_source_is_clean_end()) {
        std::printf("test_empty_source_is_clean_end failed\n");
        return EXIT_FAILURE;
    }

    if (!test_truncated_header()) {
        std::printf("test_truncated_header failed\n");
        return EXIT_FAILURE;
    }

    if (!test_truncated_body()) {
        std::printf("test_truncated_body failed\n");
        return EXIT_FAILURE;
    }

    if (!test_header_without_body()) {
        std::printf("test_header_without_body failed\n");
        return EXIT_FAILURE;
    }

    if (!test_trailing_partial_header()) {
        std::printf("test_trailing_partial_header failed\n");
        return EXIT_FAILURE;
    }

    if (!test_two_frames_then_clean_end()) {
        std::printf("test_two_frames_then_clean_end failed\n");
        return EXIT_FAILURE;
    }

    if (!test_checksum_failure_is_fatal()) {
        std::printf("test_checksum_failure_is_fatal failed\n");
        return EXIT_FAILURE;
    }

    if (!test_body_too_short_for_checksum()) {
        std::printf("test_body_too_short_for_checksum failed\n");
        return EXIT_FAILURE;
    }

    if (!test_io_error()) {
        std::printf("test_io_error failed\n");
        return EXIT_FAILURE;
    }

    if (!test_channel_closed_by_consumer()) {
        std::printf("test_channel_closed_by_consumer failed\n");
        return EXIT_FAILURE;
    }

    if (!test_stop_before_run()) {
        std::printf("test_stop_before_run failed\n");
        return EXIT_FAILURE;
    }

    if (!test_read_frame_steps()) {
        std::printf("test_read_frame_steps failed\n");
        return EXIT_FAILURE;
    }

    if (!test_ordering_with_concurrent_consumer()) {
        std::printf("test_ordering_with_concurrent_consumer failed\n");
        return EXIT_FAILURE;
    }

    if (!test_maximum_frame()) {
        std::printf("test_maximum_frame failed\n");
        return EXIT_FAILURE;
    }

    if (!test_decode_error_mapping()) {
        std::printf("test_decode_error_mapping failed\n");
        return EXIT_FAILURE;
    }

    if (!test_created_packet_reads_back()) {
        std::printf("test_created_packet_reads_back failed\n");
        return EXIT_FAILURE;
    }

    if (!test_stop_interrupts_idle_read()) {
        std::printf("test_stop_interrupts_idle_read failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All frame_reader tests passed\n");
    return EXIT_SUCCESS;
}
