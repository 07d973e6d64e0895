#pragma once

#include "spacepkt/config.hpp"
#include "spacepkt/decode_error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>

namespace spacepkt {

// Optional 8-byte timing extension: two big-endian u32, back to back.
struct SecondaryHeader {
    std::uint32_t time_week = 0;
    std::uint32_t time_ms = 0;

    bool operator==(const SecondaryHeader&) const = default;
};

using SecondaryHeaderBytes = std::array<std::byte, kSecondaryHeaderSize>;

using SecondaryHeaderResult = std::variant<SecondaryHeader, DecodeError>;

// Decode from the first 8 bytes of buf.
// Fails with DataFieldTooShort if buf holds fewer than 8 bytes.
SecondaryHeaderResult decode_secondary_header(std::span<const std::byte> buf) noexcept;

SecondaryHeaderBytes encode_secondary_header(const SecondaryHeader& header) noexcept;

}  // namespace spacepkt
