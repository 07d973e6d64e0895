#pragma once

#include <cstdint>
#include <string_view>

namespace spacepkt {

// Reasons a packet (or one of its parts) could not be decoded.
// Truncation is kept apart from content errors so callers can tell
// "not enough bytes" from "wrong bytes".
enum class DecodeError : std::uint8_t {
    HeaderSizeMismatch, // primary header buffer is not exactly 6 bytes
    DataFieldTooShort,  // data field cannot hold the checksum (and secondary header, if flagged)
    DataFieldTooLong,   // composed parts exceed the 65536-byte data field
    MalformedHeader,    // a header field decoded outside its domain
    ChecksumMismatch    // accumulated checksum over the frame is not the valid sentinel
};

// Stable name for logging
std::string_view to_string(DecodeError error) noexcept;

}  // namespace spacepkt
