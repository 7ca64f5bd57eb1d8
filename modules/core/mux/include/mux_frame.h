#pragma once

#include <cstddef>
#include <cstdint>

namespace ferry::mux {

inline constexpr uint8_t kMuxVersion = 2;

enum class FrameCmd : uint8_t {
    SYN = 0,  // open stream
    FIN = 1,  // half-close, EOF for the peer
    PSH = 2,  // data
    NOP = 3,  // keepalive
    UPD = 4,  // window update: consumed u32, window u32
};

// ver u8 | cmd u8 | length u16 | stream id u32, little endian
inline constexpr size_t kFrameHeaderSize = 8;
inline constexpr size_t kUpdPayloadSize = 8;
inline constexpr size_t kMaxFramePayload = 65535;

struct FrameHeader {
    uint8_t version = kMuxVersion;
    FrameCmd cmd = FrameCmd::NOP;
    uint16_t length = 0;
    uint32_t stream_id = 0;
};

inline void encode_frame_header(const FrameHeader& h, uint8_t* out) {
    out[0] = h.version;
    out[1] = static_cast<uint8_t>(h.cmd);
    out[2] = static_cast<uint8_t>(h.length);
    out[3] = static_cast<uint8_t>(h.length >> 8);
    out[4] = static_cast<uint8_t>(h.stream_id);
    out[5] = static_cast<uint8_t>(h.stream_id >> 8);
    out[6] = static_cast<uint8_t>(h.stream_id >> 16);
    out[7] = static_cast<uint8_t>(h.stream_id >> 24);
}

// Returns false for an unknown version or command.
inline bool decode_frame_header(const uint8_t* in, FrameHeader& h) {
    h.version = in[0];
    if (h.version != kMuxVersion || in[1] > static_cast<uint8_t>(FrameCmd::UPD)) {
        return false;
    }
    h.cmd = static_cast<FrameCmd>(in[1]);
    h.length = static_cast<uint16_t>(in[2] | (in[3] << 8));
    h.stream_id = static_cast<uint32_t>(in[4]) | (static_cast<uint32_t>(in[5]) << 8) |
                  (static_cast<uint32_t>(in[6]) << 16) | (static_cast<uint32_t>(in[7]) << 24);
    return true;
}

} // namespace ferry::mux
