#include "spacepkt/secondary_header.hpp"

namespace spacepkt {

namespace {

std::uint32_t read_u32_be(std::span<const std::byte> buf, std::size_t offset) noexcept {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        v = (v << 8) | std::to_integer<std::uint32_t>(buf[offset + i]);
    }
    return v;
}

void write_u32_be(SecondaryHeaderBytes& out, std::size_t offset, std::uint32_t v) noexcept {
    out[offset] = std::byte((v >> 24) & 0xFF);
    out[offset + 1] = std::byte((v >> 16) & 0xFF);
    out[offset + 2] = std::byte((v >> 8) & 0xFF);
    out[offset + 3] = std::byte(v & 0xFF);
}

}  // namespace

SecondaryHeaderResult decode_secondary_header(std::span<const std::byte> buf) noexcept {
    if (buf.size() < kSecondaryHeaderSize) {
        return DecodeError::DataFieldTooShort;
    }
    return SecondaryHeader{
        .time_week = read_u32_be(buf, 0),
        .time_ms = read_u32_be(buf, 4),
    };
}

SecondaryHeaderBytes encode_secondary_header(const SecondaryHeader& header) noexcept {
    SecondaryHeaderBytes out{};
    write_u32_be(out, 0, header.time_week);
    write_u32_be(out, 4, header.time_ms);
    return out;
}

}  // namespace spacepkt
