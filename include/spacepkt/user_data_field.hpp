#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace spacepkt {

// Opaque application payload. Owns a copy of its bytes, since the frame
// buffer it was sliced from is reused for the next frame.
struct UserDataField {
    std::vector<std::byte> data;

    static UserDataField from_buffer(std::span<const std::byte> buf) {
        return UserDataField{ std::vector<std::byte>(buf.begin(), buf.end()) };
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept { return data; }

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }

    bool operator==(const UserDataField&) const = default;
};

}  // namespace spacepkt
