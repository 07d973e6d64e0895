#include "spacepkt/checksum.hpp"

namespace spacepkt {

void ChecksumAccumulator::append(State state, std::vector<std::byte>& out) const {
    const std::uint16_t value = finalize(state);
    out.push_back(std::byte((value >> 8) & 0xFF));
    out.push_back(std::byte(value & 0xFF));
}

ChecksumAccumulator::State Crc16Ccitt::accumulate(
    State state, std::span<const std::byte> bytes) const noexcept {
    std::uint16_t crc = state;
    for (std::byte b : bytes) {
        crc ^= static_cast<std::uint16_t>(std::to_integer<std::uint16_t>(b) << 8);
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<std::uint16_t>((crc << 1) ^ kPolynomial);
            } else {
                crc = static_cast<std::uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

const ChecksumAccumulator& crc16_ccitt() noexcept {
    static const Crc16Ccitt instance;
    return instance;
}

ChecksumAccumulator::State compute_checksum(
    const ChecksumAccumulator& acc, std::span<const std::byte> bytes) noexcept {
    return acc.accumulate(acc.initial(), bytes);
}

}  // namespace spacepkt
