#pragma once

#include "spacepkt/checksum.hpp"
#include "spacepkt/decode_error.hpp"
#include "spacepkt/primary_header.hpp"
#include "spacepkt/secondary_header.hpp"
#include "spacepkt/user_data_field.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace spacepkt {

// ============================================================================
// Space Packet
//
// Wire layout:
//   [primary header 6][secondary header 0|8][user data 0..n][checksum 2]
//   |<------------- header ----------->|<-- data field (data_length + 1) -->|
//
// The data field always ends with the checksum. Which of the two optional
// parts precede it is one of four layouts, keyed by the secondary header
// flag and the data field length.
// ============================================================================

enum class DataFieldLayout : std::uint8_t {
    ChecksumOnly,                // [checksum]
    SecondaryHeaderOnly,         // [secondary][checksum]
    UserDataOnly,                // [user data][checksum]
    SecondaryHeaderAndUserData,  // [secondary][user data][checksum]
};

using LayoutResult = std::variant<DataFieldLayout, DecodeError>;

// Determine the data field layout.
// Fails with DataFieldTooShort if the field cannot hold the checksum, or the
// secondary header plus checksum when the flag is set.
LayoutResult classify_data_field(bool has_secondary_header, std::size_t data_len) noexcept;

// data_length value (octets - 1) for a data field holding the given parts,
// or nullopt if they exceed kDataFieldMaxSize.
[[nodiscard]] std::optional<std::uint16_t> data_length_for(bool has_secondary_header,
                                                           std::size_t user_data_size) noexcept;

// A frame split the way the reader reads it
struct FrameBuffers {
    std::vector<std::byte> header;  // primary header, 6 bytes
    std::vector<std::byte> data;    // data field including checksum
};

// Immutable decoded packet value.
class Packet;
using PacketResult = std::variant<Packet, DecodeError>;

class Packet {
public:
    // Compose a packet from decoded parts and compute its checksum.
    // An empty user data field is stored as absent (identical on the wire).
    // secondary_header_flag and data_length are taken from the parts, not
    // from primary. Fails with DataFieldTooLong past kDataFieldMaxSize.
    static PacketResult create(PrimaryHeader primary,
                               std::optional<SecondaryHeader> secondary,
                               std::optional<UserDataField> user_data,
                               const ChecksumAccumulator& acc = crc16_ccitt());

    // Decode a frame from its header bytes and its data field bytes.
    //
    // Contract:
    // - header must be exactly 6 bytes
    // - the checksum is run over header ++ data (trailing checksum included)
    //   and must land on the accumulator's valid state
    // - never throws for malformed input; errors come back as DecodeError
    static PacketResult from_buffers(
        std::span<const std::byte> header,
        std::span<const std::byte> data,
        const ChecksumAccumulator& acc = crc16_ccitt());

    [[nodiscard]] const PrimaryHeader& primary_header() const noexcept { return primary_; }
    [[nodiscard]] const std::optional<SecondaryHeader>& secondary_header() const noexcept {
        return secondary_;
    }
    [[nodiscard]] const std::optional<UserDataField>& user_data() const noexcept {
        return user_data_;
    }
    [[nodiscard]] std::uint16_t checksum() const noexcept { return checksum_; }

    [[nodiscard]] DataFieldLayout layout() const noexcept;

    // Serialize as one contiguous frame with the checksum appended.
    [[nodiscard]] std::vector<std::byte> to_buffer(
        const ChecksumAccumulator& acc = crc16_ccitt()) const;

    // Serialize as (header, data field). The checksum is accumulated over
    // the header first, then continued over the data field.
    [[nodiscard]] FrameBuffers to_buffers(
        const ChecksumAccumulator& acc = crc16_ccitt()) const;

    bool operator==(const Packet&) const = default;

private:
    Packet(PrimaryHeader primary,
           std::optional<SecondaryHeader> secondary,
           std::optional<UserDataField> user_data,
           std::uint16_t checksum);

    // Append secondary header and user data (if any) to out
    void append_data_parts(std::vector<std::byte>& out) const;

    PrimaryHeader primary_;
    std::optional<SecondaryHeader> secondary_;
    std::optional<UserDataField> user_data_;
    std::uint16_t checksum_;
};

}  // namespace spacepkt
