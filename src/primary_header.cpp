#include "spacepkt/primary_header.hpp"

namespace spacepkt {

namespace {

// Word 0
constexpr std::uint16_t kVersionMask = 0xE000;
constexpr std::uint16_t kPacketTypeMask = 0x1000;
constexpr std::uint16_t kSecHeaderFlagMask = 0x0800;
constexpr std::uint16_t kApidMask = 0x07FF;
constexpr int kVersionShift = 13;
constexpr int kPacketTypeShift = 12;
constexpr int kSecHeaderFlagShift = 11;

// Word 1
constexpr std::uint16_t kSequenceFlagsMask = 0xC000;
constexpr std::uint16_t kSequenceCounterMask = 0x3FFF;
constexpr int kSequenceFlagsShift = 14;

std::uint16_t read_u16_be(std::span<const std::byte, kPrimaryHeaderSize> bytes,
                          std::size_t offset) noexcept {
    const auto hi = std::to_integer<std::uint16_t>(bytes[offset]);
    const auto lo = std::to_integer<std::uint16_t>(bytes[offset + 1]);
    return static_cast<std::uint16_t>((hi << 8) | lo);
}

void write_u16_be(PrimaryHeaderBytes& out, std::size_t offset, std::uint16_t v) noexcept {
    out[offset] = std::byte((v >> 8) & 0xFF);
    out[offset + 1] = std::byte(v & 0xFF);
}

}  // namespace

std::optional<PacketType> packet_type_from_code(std::uint8_t code) noexcept {
    switch (code) {
        case 0:
            return PacketType::Telemetry;
        case 1:
            return PacketType::Telecommand;
        default:
            return std::nullopt;
    }
}

PrimaryHeaderResult decode_primary_header(
    std::span<const std::byte, kPrimaryHeaderSize> bytes) noexcept {
    const std::uint16_t id_word = read_u16_be(bytes, 0);
    const std::uint16_t seq_word = read_u16_be(bytes, 2);

    const auto type_code =
        static_cast<std::uint8_t>((id_word & kPacketTypeMask) >> kPacketTypeShift);
    const auto packet_type = packet_type_from_code(type_code);
    if (!packet_type) {
        return DecodeError::MalformedHeader;
    }

    PrimaryHeader header;
    header.version_number =
        static_cast<std::uint8_t>((id_word & kVersionMask) >> kVersionShift);
    header.packet_type = *packet_type;
    header.secondary_header_flag = (id_word & kSecHeaderFlagMask) != 0;
    header.apid = static_cast<std::uint16_t>(id_word & kApidMask);
    header.sequence_flags =
        static_cast<std::uint8_t>((seq_word & kSequenceFlagsMask) >> kSequenceFlagsShift);
    header.sequence_counter = static_cast<std::uint16_t>(seq_word & kSequenceCounterMask);
    header.data_length = read_u16_be(bytes, 4);
    return header;
}

PrimaryHeaderBytes encode_primary_header(const PrimaryHeader& header) noexcept {
    std::uint16_t id_word = 0;
    id_word |= static_cast<std::uint16_t>(header.version_number << kVersionShift) & kVersionMask;
    id_word |= static_cast<std::uint16_t>(
                   static_cast<std::uint16_t>(header.packet_type) << kPacketTypeShift) &
               kPacketTypeMask;
    if (header.secondary_header_flag) {
        id_word |= kSecHeaderFlagMask;
    }
    id_word |= header.apid & kApidMask;

    std::uint16_t seq_word = 0;
    seq_word |= static_cast<std::uint16_t>(header.sequence_flags << kSequenceFlagsShift) &
                kSequenceFlagsMask;
    seq_word |= header.sequence_counter & kSequenceCounterMask;

    PrimaryHeaderBytes out{};
    write_u16_be(out, 0, id_word);
    write_u16_be(out, 2, seq_word);
    write_u16_be(out, 4, header.data_length);
    return out;
}

bool fits_bit_widths(const PrimaryHeader& header) noexcept {
    return header.version_number <= PrimaryHeaderLimits::kMaxVersion &&
           packet_type_from_code(static_cast<std::uint8_t>(header.packet_type)).has_value() &&
           header.apid <= PrimaryHeaderLimits::kMaxApid &&
           header.sequence_flags <= PrimaryHeaderLimits::kMaxSequenceFlags &&
           header.sequence_counter <= PrimaryHeaderLimits::kMaxSequenceCounter;
}

std::size_t body_length(std::span<const std::byte, kPrimaryHeaderSize> bytes) noexcept {
    // Widen before adding one: 0xFFFF announces 65536 octets
    return static_cast<std::size_t>(read_u16_be(bytes, 4)) + 1;
}

}  // namespace spacepkt
