#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace spacepkt {

// ============================================================================
// Checksum Accumulator Interface
//
// A running checksum threaded through decode and encode. The frame carries
// the finalized value in its last 2 bytes (big-endian).
//
// Contract:
// - accumulate is incremental: accumulate(accumulate(s, a), b) equals
//   accumulate(s, a ++ b), so header and body can be folded separately.
// - is_valid(accumulate(initial(), frame)) holds exactly when the frame's
//   trailing checksum bytes match the bytes before them.
//
// Implementations must be stateless (all state lives in State) so a single
// instance can be shared across threads.
// ============================================================================

class ChecksumAccumulator {
public:
    using State = std::uint16_t;

    virtual ~ChecksumAccumulator() = default;

    [[nodiscard]] virtual State initial() const noexcept = 0;

    [[nodiscard]] virtual State accumulate(State state,
                                           std::span<const std::byte> bytes) const noexcept = 0;

    [[nodiscard]] virtual bool is_valid(State state) const noexcept = 0;

    // Checksum value to place on the wire for a running state
    [[nodiscard]] virtual std::uint16_t finalize(State state) const noexcept = 0;

    // Finalize and append the 2 checksum bytes (big-endian) to out.
    void append(State state, std::vector<std::byte>& out) const;
};

// ============================================================================
// Crc16Ccitt: CRC-16/CCITT-FALSE
//
// poly 0x1021, init 0xFFFF, MSB first, no final xor. Running the CRC over
// data followed by its own big-endian CRC yields 0 (the valid sentinel).
// ============================================================================

class Crc16Ccitt final : public ChecksumAccumulator {
public:
    static constexpr State kInitialValue = 0xFFFF;
    static constexpr std::uint16_t kPolynomial = 0x1021;

    [[nodiscard]] State initial() const noexcept override { return kInitialValue; }

    [[nodiscard]] State accumulate(State state,
                                   std::span<const std::byte> bytes) const noexcept override;

    [[nodiscard]] bool is_valid(State state) const noexcept override { return state == 0; }

    [[nodiscard]] std::uint16_t finalize(State state) const noexcept override { return state; }
};

// Shared default accumulator
const ChecksumAccumulator& crc16_ccitt() noexcept;

// One-shot helper: accumulate over bytes starting from initial()
[[nodiscard]] ChecksumAccumulator::State compute_checksum(
    const ChecksumAccumulator& acc, std::span<const std::byte> bytes) noexcept;

}  // namespace spacepkt
