#pragma once

#include "spacepkt/config.hpp"
#include "spacepkt/decode_error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

namespace spacepkt {

// ============================================================================
// Primary Header (6 bytes, big-endian)
//
//  word 0: | version (3) | type (1) | sec hdr flag (1) | APID (11)     |
//  word 1: | sequence flags (2)     | sequence counter (14)            |
//  word 2: | data length (16) = data field octets - 1                   |
// ============================================================================

enum class PacketType : std::uint8_t {
    Telemetry = 0,
    Telecommand = 1,
};

// Field widths (maximum values)
struct PrimaryHeaderLimits {
    static constexpr std::uint8_t kMaxVersion = 0x07;
    static constexpr std::uint16_t kMaxApid = 0x07FF;
    static constexpr std::uint8_t kMaxSequenceFlags = 0x03;
    static constexpr std::uint16_t kMaxSequenceCounter = 0x3FFF;
};

struct PrimaryHeader {
    std::uint8_t version_number = 0;
    PacketType packet_type = PacketType::Telemetry;
    bool secondary_header_flag = false;
    std::uint16_t apid = 0;
    std::uint8_t sequence_flags = 0;
    std::uint16_t sequence_counter = 0;
    std::uint16_t data_length = 0;  // data field length - 1

    bool operator==(const PrimaryHeader&) const = default;
};

using PrimaryHeaderBytes = std::array<std::byte, kPrimaryHeaderSize>;

using PrimaryHeaderResult = std::variant<PrimaryHeader, DecodeError>;

// Map a raw packet type code to the enum.
// Returns nullopt for codes outside {0, 1}.
std::optional<PacketType> packet_type_from_code(std::uint8_t code) noexcept;

// Decode the seven fields from 6 raw bytes.
// Fails with MalformedHeader if an enumerated field is out of domain.
PrimaryHeaderResult decode_primary_header(
    std::span<const std::byte, kPrimaryHeaderSize> bytes) noexcept;

// Compose the 6 wire bytes. Each field is masked to its bit width, so an
// out-of-range value never bleeds into a neighbouring field.
PrimaryHeaderBytes encode_primary_header(const PrimaryHeader& header) noexcept;

// True if every field fits its bit width (encode is then lossless)
[[nodiscard]] bool fits_bit_widths(const PrimaryHeader& header) noexcept;

// Length of the data field announced by raw header bytes:
// big-endian u16 at [4:6) plus one.
[[nodiscard]] std::size_t body_length(
    std::span<const std::byte, kPrimaryHeaderSize> bytes) noexcept;

}  // namespace spacepkt
