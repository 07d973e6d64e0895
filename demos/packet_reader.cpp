// Packet Reader Demo
//
// Decodes a stream of space packets and logs every packet.
// Main thread:   byte source -> FrameReader -> PacketChannel
// Logger thread: PacketChannel -> stdout
//
// Usage:
//   ./packet_reader [file] [--quiet | --verbose]
//
// Options:
//   file      - Read frames from this file (default: stdin)
//   --quiet   - Only print the final summary
//   --verbose - Print secondary header and user data bytes, plus lifecycle messages

#include "spacepkt/byte_source.hpp"
#include "spacepkt/config.hpp"
#include "spacepkt/frame_reader.hpp"
#include "spacepkt/packet.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <thread>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>  // close()

namespace {

enum class Verbosity { Quiet, Info, Debug };

// Reader to stop on SIGINT/SIGTERM (honoured at the next frame boundary)
std::atomic<spacepkt::FrameReader*> g_reader{nullptr};
// Lets the signal break a read blocked on idle input
std::atomic<bool> g_interrupted{false};

void signal_handler(int /*signum*/) {
    g_interrupted = true;
    if (auto* reader = g_reader.load()) {
        reader->request_stop();
    }
}

// No SA_RESTART, so a blocked read() returns EINTR
bool install_stop_handler(int signum) {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(signum, &sa, nullptr) == 0;
}

const char* packet_type_name(spacepkt::PacketType type) {
    return type == spacepkt::PacketType::Telemetry ? "TM" : "TC";
}

std::string hex_bytes(std::span<const std::byte> bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::byte b : bytes) {
        const auto v = std::to_integer<unsigned>(b);
        if (!out.empty()) out += ' ';
        out += kDigits[v >> 4];
        out += kDigits[v & 0x0F];
    }
    return out;
}

void print_packet(std::uint64_t counter, const spacepkt::Packet& pkt, Verbosity verbosity) {
    const auto& h = pkt.primary_header();
    std::printf("#%llu %s ver=%u apid=0x%04X seq_flags=%u seq=%u data_len=%u crc=0x%04X",
                static_cast<unsigned long long>(counter),
                packet_type_name(h.packet_type),
                static_cast<unsigned>(h.version_number),
                static_cast<unsigned>(h.apid),
                static_cast<unsigned>(h.sequence_flags),
                static_cast<unsigned>(h.sequence_counter),
                static_cast<unsigned>(h.data_length),
                static_cast<unsigned>(pkt.checksum()));

    if (const auto& sec = pkt.secondary_header()) {
        std::printf(" week=%u ms=%u",
                    static_cast<unsigned>(sec->time_week),
                    static_cast<unsigned>(sec->time_ms));
    }

    const auto& user = pkt.user_data();
    std::printf(" user=%zuB\n", user ? user->size() : std::size_t{0});

    if (verbosity == Verbosity::Debug && user) {
        std::printf("    %s\n", hex_bytes(user->buffer()).c_str());
    }
}

void print_stats(const spacepkt::ReaderMetrics& metrics, std::uint64_t logged) {
    std::fprintf(stderr, "\n--- Stats ---\n");
    std::fprintf(stderr, "Bytes read:        %llu\n",
                 static_cast<unsigned long long>(metrics.bytes_read));
    std::fprintf(stderr, "Frames read:       %llu\n",
                 static_cast<unsigned long long>(metrics.frames_read));
    std::fprintf(stderr, "Packets emitted:   %llu\n",
                 static_cast<unsigned long long>(metrics.packets_emitted));
    std::fprintf(stderr, "Packets logged:    %llu\n", static_cast<unsigned long long>(logged));
    std::fprintf(stderr, "Checksum failures: %llu\n",
                 static_cast<unsigned long long>(metrics.checksum_failures));
    std::fprintf(stderr, "Truncations:       %llu\n",
                 static_cast<unsigned long long>(metrics.truncations));
    std::fprintf(stderr, "-------------\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    const char* path = nullptr;
    Verbosity verbosity = Verbosity::Info;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--quiet") == 0) {
            verbosity = Verbosity::Quiet;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = Verbosity::Debug;
        } else if (argv[i][0] != '-') {
            path = argv[i];
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_FAILURE;
        }
    }

    int fd = STDIN_FILENO;
    if (path != nullptr) {
        fd = open(path, O_RDONLY);
        if (fd < 0) {
            std::fprintf(stderr, "Failed to open %s: %s\n", path, std::strerror(errno));
            return EXIT_FAILURE;
        }
    }

    const spacepkt::PipelineConfig config = spacepkt::kDefaultConfig;

    spacepkt::FdByteSource source(fd, &g_interrupted);
    spacepkt::PacketChannel channel(config.channel.capacity);
    spacepkt::FrameReader reader(source, channel, config.reader);

    g_reader = &reader;
    if (!install_stop_handler(SIGINT) || !install_stop_handler(SIGTERM)) {
        std::fprintf(stderr, "Failed to install signal handler: %s\n", std::strerror(errno));
        return EXIT_FAILURE;
    }

    if (verbosity == Verbosity::Debug) {
        std::fprintf(stderr, "[debug] reading frames from %s (channel capacity %zu)\n",
                     path != nullptr ? path : "stdin", channel.capacity());
    }

    // The logger starts with SIGINT/SIGTERM blocked, so they land on the
    // reading thread and interrupt its read
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    sigset_t previous;
    pthread_sigmask(SIG_BLOCK, &stop_signals, &previous);

    // Logger job: drains the channel until the reader closes it
    std::uint64_t logged = 0;
    std::thread logger([&] {
        while (auto pkt = channel.pop()) {
            ++logged;
            if (verbosity != Verbosity::Quiet) {
                print_packet(logged, *pkt, verbosity);
            }
        }
        std::fflush(stdout);
    });
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);

    // Reader job, on the main thread
    const spacepkt::RunResult result = reader.run();
    if (verbosity == Verbosity::Debug) {
        std::fprintf(stderr, "[debug] reader job stopped\n");
    }

    logger.join();
    if (verbosity == Verbosity::Debug) {
        std::fprintf(stderr, "[debug] logger job stopped\n");
    }

    g_reader = nullptr;
    if (path != nullptr) {
        close(fd);
    }

    print_stats(reader.metrics(), logged);

    switch (result.status) {
        case spacepkt::RunStatus::Completed:
            return EXIT_SUCCESS;
        case spacepkt::RunStatus::Stopped:
            std::fprintf(stderr, "Stopped on request\n");
            return EXIT_SUCCESS;
        case spacepkt::RunStatus::Failed:
            break;
    }

    const std::string reason(spacepkt::to_string(result.error));
    if (result.error == spacepkt::FrameError::IoError) {
        std::fprintf(stderr, "Reader failed: %s (%s)\n", reason.c_str(),
                     std::strerror(result.error_code));
    } else {
        std::fprintf(stderr, "Reader failed: %s\n", reason.c_str());
    }
    return EXIT_FAILURE;
}
