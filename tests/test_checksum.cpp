#include "spacepkt/checksum.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <random>
#include <span>
#include <vector>

namespace {

std::vector<std::byte> to_bytes(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(std::byte(v));
    }
    return out;
}

// Telemetry frame with secondary header, checksum excluded
const std::vector<std::byte> kFrame1 = to_bytes({
    0x08, 0x73, 0xC1, 0x23, 0x00, 0x0F,
    0x00, 0x00, 0x12, 0x34, 0x00, 0xAB, 0xCD, 0xEF,
    0xA5, 0xA5, 0x5A, 0x5A, 0xC3, 0x3C,
});

// Telecommand frame without secondary header, checksum excluded
const std::vector<std::byte> kFrame2 = to_bytes({
    0x17, 0x54, 0xC6, 0x82, 0x00, 0x04,
    0x01, 0x02, 0x00,
});

bool test_known_check_value() {
    // CRC-16/CCITT-FALSE check value over ASCII "123456789"
    const auto& acc = spacepkt::crc16_ccitt();
    const auto input = to_bytes({'1', '2', '3', '4', '5', '6', '7', '8', '9'});
    return acc.finalize(spacepkt::compute_checksum(acc, input)) == 0x29B1;
}

bool test_empty_input_is_initial() {
    const auto& acc = spacepkt::crc16_ccitt();
    return spacepkt::compute_checksum(acc, {}) == acc.initial();
}

bool test_reference_frames() {
    const auto& acc = spacepkt::crc16_ccitt();
    if (acc.finalize(spacepkt::compute_checksum(acc, kFrame1)) != 0xC1F8) return false;
    if (acc.finalize(spacepkt::compute_checksum(acc, kFrame2)) != 0x2DDD) return false;
    return true;
}

// Running over data ++ checksum lands on the valid state
bool test_append_makes_frame_valid() {
    const auto& acc = spacepkt::crc16_ccitt();

    for (const auto* frame : {&kFrame1, &kFrame2}) {
        std::vector<std::byte> buf = *frame;
        acc.append(spacepkt::compute_checksum(acc, buf), buf);
        if (buf.size() != frame->size() + 2) return false;
        if (!acc.is_valid(spacepkt::compute_checksum(acc, buf))) return false;
    }

    // Checksum bytes are big-endian
    std::vector<std::byte> buf = kFrame1;
    acc.append(spacepkt::compute_checksum(acc, buf), buf);
    if (buf[buf.size() - 2] != std::byte{0xC1}) return false;
    if (buf[buf.size() - 1] != std::byte{0xF8}) return false;

    return true;
}

// accumulate(accumulate(s, a), b) == accumulate(s, a ++ b) at every split
bool test_incremental_matches_one_shot() {
    const auto& acc = spacepkt::crc16_ccitt();
    std::mt19937 gen(4242);
    std::uniform_int_distribution<int> byte_dist(0, 0xFF);

    std::vector<std::byte> data(257);
    for (auto& b : data) {
        b = std::byte(byte_dist(gen));
    }

    const auto whole = spacepkt::compute_checksum(acc, data);
    const std::span<const std::byte> view(data);

    for (std::size_t split = 0; split <= data.size(); ++split) {
        auto state = acc.accumulate(acc.initial(), view.first(split));
        state = acc.accumulate(state, view.subspan(split));
        if (state != whole) {
            std::printf("split at %zu mismatched\n", split);
            return false;
        }
    }
    return true;
}

bool test_single_bit_flip_detected() {
    const auto& acc = spacepkt::crc16_ccitt();
    std::vector<std::byte> buf = kFrame1;
    acc.append(spacepkt::compute_checksum(acc, buf), buf);

    for (std::size_t i = 0; i < buf.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<std::byte> corrupted = buf;
            corrupted[i] ^= std::byte(1 << bit);
            if (acc.is_valid(spacepkt::compute_checksum(acc, corrupted))) {
                std::printf("bit flip at byte %zu bit %d not detected\n", i, bit);
                return false;
            }
        }
    }
    return true;
}

}  // namespace

int main() {
    if (!test_known_check_value()) {
        std::printf("test_known_check_value failed\n");
        return EXIT_FAILURE;
    }

    if (!test_empty_input_is_initial()) {
        std::printf("test_empty_input_is_initial failed\n");
        return EXIT_FAILURE;
    }

    if (!test_reference_frames()) {
        std::printf("test_reference_frames failed\n");
        return EXIT_FAILURE;
    }

    if (!test_append_makes_frame_valid()) {
        std::printf("test_append_makes_frame_valid failed\n");
        return EXIT_FAILURE;
    }

    if (!test_incremental_matches_one_shot()) {
        std::printf("test_incremental_matches_one_shot failed\n");
        return EXIT_FAILURE;
    }

    if (!test_single_bit_flip_detected()) {
        std::printf("test_single_bit_flip_detected failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All checksum tests passed\n");
    return EXIT_SUCCESS;
}
