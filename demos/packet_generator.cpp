// Packet Generator Demo
//
// Writes a stream of valid space packets to stdout, for piping into
// packet_reader.
//
// Usage:
//   ./packet_generator [count] [--corrupt] [--truncate] [--seed N]
//
// Options:
//   count      - Number of packets to emit (default: 100)
//   --corrupt  - Flip one checksum bit of the last packet
//   --truncate - Cut the last packet short
//   --seed N   - Seed for the random generator (default: random)
//
// Example:
//   ./packet_generator 1000 | ./packet_reader --quiet

#include "spacepkt/packet.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>  // std::size
#include <optional>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <unistd.h>

namespace {

class Random {
public:
    explicit Random(std::uint32_t seed) : gen_(seed) {}

    int range(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    double uniform() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen_);
    }

private:
    std::mt19937 gen_;
};

// Applications emitting packets
const std::uint16_t APIDS[] = {0x0010, 0x0073, 0x0100, 0x0200, 0x0754};

spacepkt::PacketResult make_packet(Random& rng, std::uint16_t counter) {
    const bool with_secondary = rng.uniform() < 0.5;
    const auto payload_size = static_cast<std::size_t>(rng.range(0, 256));

    spacepkt::PrimaryHeader primary{
        .version_number = 0,
        .packet_type = rng.uniform() < 0.8 ? spacepkt::PacketType::Telemetry
                                           : spacepkt::PacketType::Telecommand,
        .apid = APIDS[rng.range(0, static_cast<int>(std::size(APIDS)) - 1)],
        .sequence_flags = 0x03,  // unsegmented
        .sequence_counter = static_cast<std::uint16_t>(counter & 0x3FFF),
    };

    std::optional<spacepkt::SecondaryHeader> secondary;
    if (with_secondary) {
        secondary = spacepkt::SecondaryHeader{
            .time_week = static_cast<std::uint32_t>(rng.range(2000, 2400)),
            .time_ms = static_cast<std::uint32_t>(rng.range(0, 604'799'999)),
        };
    }

    std::optional<spacepkt::UserDataField> user_data;
    if (payload_size > 0) {
        spacepkt::UserDataField field;
        field.data.resize(payload_size);
        for (auto& b : field.data) {
            b = std::byte(rng.range(0, 0xFF));
        }
        user_data = std::move(field);
    }

    return spacepkt::Packet::create(primary, secondary, std::move(user_data));
}

// Write all bytes, retrying short writes
bool write_all(std::span<const std::byte> bytes) {
    while (!bytes.empty()) {
        ssize_t n = write(STDOUT_FILENO, bytes.data(), bytes.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        bytes = bytes.subspan(static_cast<std::size_t>(n));
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    long count = 100;
    bool corrupt = false;
    bool truncate = false;
    std::uint32_t seed = std::random_device{}();

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--corrupt") == 0) {
            corrupt = true;
        } else if (std::strcmp(argv[i], "--truncate") == 0) {
            truncate = true;
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (argv[i][0] != '-') {
            count = std::atol(argv[i]);
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_FAILURE;
        }
    }

    if (count <= 0) {
        std::fprintf(stderr, "Packet count must be positive\n");
        return EXIT_FAILURE;
    }

    std::fprintf(stderr, "Generating %ld packets (seed %u)%s%s\n", count,
                 static_cast<unsigned>(seed),
                 corrupt ? " [corrupt last]" : "",
                 truncate ? " [truncate last]" : "");

    Random rng(seed);
    std::uint64_t bytes_written = 0;

    for (long i = 0; i < count; ++i) {
        auto made = make_packet(rng, static_cast<std::uint16_t>(i));
        if (const auto* err = std::get_if<spacepkt::DecodeError>(&made)) {
            const std::string reason(spacepkt::to_string(*err));
            std::fprintf(stderr, "Packet %ld not built: %s\n", i, reason.c_str());
            return EXIT_FAILURE;
        }
        auto frame = std::get<spacepkt::Packet>(made).to_buffer();

        const bool last = i + 1 == count;
        if (last && corrupt) {
            frame.back() ^= std::byte{0x01};
        }
        if (last && truncate) {
            frame.resize(frame.size() - 1);
        }

        if (!write_all(frame)) {
            std::fprintf(stderr, "Write failed: %s\n", std::strerror(errno));
            return EXIT_FAILURE;
        }
        bytes_written += frame.size();
    }

    std::fprintf(stderr, "Wrote %llu bytes\n", static_cast<unsigned long long>(bytes_written));
    return EXIT_SUCCESS;
}
