#include "spacepkt/packet.hpp"

#include <utility>

namespace spacepkt {

LayoutResult classify_data_field(bool has_secondary_header, std::size_t data_len) noexcept {
    const std::size_t fixed =
        kChecksumSize + (has_secondary_header ? kSecondaryHeaderSize : 0);
    if (data_len < fixed) {
        return DecodeError::DataFieldTooShort;
    }

    const bool has_user_data = data_len > fixed;
    if (has_secondary_header) {
        return has_user_data ? DataFieldLayout::SecondaryHeaderAndUserData
                             : DataFieldLayout::SecondaryHeaderOnly;
    }
    return has_user_data ? DataFieldLayout::UserDataOnly : DataFieldLayout::ChecksumOnly;
}

std::optional<std::uint16_t> data_length_for(bool has_secondary_header,
                                             std::size_t user_data_size) noexcept {
    const std::size_t fixed =
        kChecksumSize + (has_secondary_header ? kSecondaryHeaderSize : 0);
    if (user_data_size > kDataFieldMaxSize - fixed) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(fixed + user_data_size - 1);
}

Packet::Packet(PrimaryHeader primary,
               std::optional<SecondaryHeader> secondary,
               std::optional<UserDataField> user_data,
               std::uint16_t checksum)
    : primary_(primary)
    , secondary_(secondary)
    , user_data_(std::move(user_data))
    , checksum_(checksum) {}

PacketResult Packet::create(PrimaryHeader primary,
                            std::optional<SecondaryHeader> secondary,
                            std::optional<UserDataField> user_data,
                            const ChecksumAccumulator& acc) {
    if (user_data && user_data->data.empty()) {
        user_data.reset();
    }

    const auto data_length =
        data_length_for(secondary.has_value(), user_data ? user_data->size() : 0);
    if (!data_length) {
        return DecodeError::DataFieldTooLong;
    }
    primary.secondary_header_flag = secondary.has_value();
    primary.data_length = *data_length;

    const auto header_bytes = encode_primary_header(primary);
    auto state = acc.accumulate(acc.initial(), header_bytes);

    if (secondary) {
        const auto sec_bytes = encode_secondary_header(*secondary);
        state = acc.accumulate(state, sec_bytes);
    }

    if (user_data) {
        state = acc.accumulate(state, user_data->buffer());
    }

    return Packet(primary, secondary, std::move(user_data), acc.finalize(state));
}

PacketResult Packet::from_buffers(std::span<const std::byte> header,
                                  std::span<const std::byte> data,
                                  const ChecksumAccumulator& acc) {
    if (header.size() != kPrimaryHeaderSize) {
        return DecodeError::HeaderSizeMismatch;
    }

    auto header_result =
        decode_primary_header(header.first<kPrimaryHeaderSize>());
    if (const auto* err = std::get_if<DecodeError>(&header_result)) {
        return *err;
    }
    const auto& primary = std::get<PrimaryHeader>(header_result);

    auto layout_result = classify_data_field(primary.secondary_header_flag, data.size());
    if (const auto* err = std::get_if<DecodeError>(&layout_result)) {
        return *err;
    }

    // Over the whole frame, trailing checksum included
    auto state = acc.accumulate(acc.initial(), header);
    state = acc.accumulate(state, data);
    if (!acc.is_valid(state)) {
        return DecodeError::ChecksumMismatch;
    }

    const std::size_t end = data.size() - kChecksumSize;
    std::optional<SecondaryHeader> secondary;
    std::optional<UserDataField> user_data;

    switch (std::get<DataFieldLayout>(layout_result)) {
        case DataFieldLayout::ChecksumOnly:
            break;
        case DataFieldLayout::SecondaryHeaderOnly:
            secondary = std::get<SecondaryHeader>(decode_secondary_header(data));
            break;
        case DataFieldLayout::UserDataOnly:
            user_data = UserDataField::from_buffer(data.first(end));
            break;
        case DataFieldLayout::SecondaryHeaderAndUserData:
            secondary = std::get<SecondaryHeader>(decode_secondary_header(data));
            user_data = UserDataField::from_buffer(
                data.subspan(kSecondaryHeaderSize, end - kSecondaryHeaderSize));
            break;
    }

    const auto hi = std::to_integer<std::uint16_t>(data[end]);
    const auto lo = std::to_integer<std::uint16_t>(data[end + 1]);
    const auto checksum = static_cast<std::uint16_t>((hi << 8) | lo);

    return Packet(primary, secondary, std::move(user_data), checksum);
}

DataFieldLayout Packet::layout() const noexcept {
    if (secondary_) {
        return user_data_ ? DataFieldLayout::SecondaryHeaderAndUserData
                          : DataFieldLayout::SecondaryHeaderOnly;
    }
    return user_data_ ? DataFieldLayout::UserDataOnly : DataFieldLayout::ChecksumOnly;
}

void Packet::append_data_parts(std::vector<std::byte>& out) const {
    if (secondary_) {
        const auto sec_bytes = encode_secondary_header(*secondary_);
        out.insert(out.end(), sec_bytes.begin(), sec_bytes.end());
    }
    if (user_data_) {
        out.insert(out.end(), user_data_->data.begin(), user_data_->data.end());
    }
}

std::vector<std::byte> Packet::to_buffer(const ChecksumAccumulator& acc) const {
    const auto header_bytes = encode_primary_header(primary_);

    std::vector<std::byte> out;
    out.reserve(kPrimaryHeaderSize + kSecondaryHeaderSize +
                (user_data_ ? user_data_->size() : 0) + kChecksumSize);
    out.insert(out.end(), header_bytes.begin(), header_bytes.end());
    append_data_parts(out);

    acc.append(compute_checksum(acc, out), out);
    return out;
}

FrameBuffers Packet::to_buffers(const ChecksumAccumulator& acc) const {
    const auto header_bytes = encode_primary_header(primary_);

    FrameBuffers frame;
    frame.header.assign(header_bytes.begin(), header_bytes.end());
    append_data_parts(frame.data);

    auto state = acc.accumulate(acc.initial(), frame.header);
    state = acc.accumulate(state, frame.data);
    acc.append(state, frame.data);
    return frame;
}

}  // namespace spacepkt
