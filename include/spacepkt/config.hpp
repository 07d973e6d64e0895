#pragma once

#include <cstddef>

namespace spacepkt {

// Wire format sizes (bytes)
inline constexpr std::size_t kPrimaryHeaderSize = 6;
inline constexpr std::size_t kSecondaryHeaderSize = 8;
inline constexpr std::size_t kChecksumSize = 2;

// data_length is 16 bits and counts (octets - 1), so at most 65536 octets
inline constexpr std::size_t kDataFieldMaxSize = 65536;
inline constexpr std::size_t kFrameMaxSize = kPrimaryHeaderSize + kDataFieldMaxSize;

// Packet channel configuration
// Controls how many decoded packets may be pending for consumers
struct ChannelConfig {
    std::size_t capacity = 1024;           // max queued packets
};

// Frame reader configuration
struct ReaderConfig {
    std::size_t buffer_bytes = kFrameMaxSize;  // body buffer reserved up front
};

// Top-level pipeline configuration
struct PipelineConfig {
    ChannelConfig channel;
    ReaderConfig reader;
};

inline constexpr PipelineConfig kDefaultConfig = {};

}  // namespace spacepkt
