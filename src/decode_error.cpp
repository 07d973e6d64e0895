#include "spacepkt/decode_error.hpp"

namespace spacepkt {

std::string_view to_string(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::HeaderSizeMismatch:
            return "header_size_mismatch";
        case DecodeError::DataFieldTooShort:
            return "data_field_too_short";
        case DecodeError::DataFieldTooLong:
            return "data_field_too_long";
        case DecodeError::MalformedHeader:
            return "malformed_header";
        case DecodeError::ChecksumMismatch:
            return "checksum_mismatch";
    }
    return "unknown";
}

}  // namespace spacepkt
