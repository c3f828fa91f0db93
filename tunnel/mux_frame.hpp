#pragma once

// ============================================================
// mux_frame.hpp -- smux-compatible frame layout
//
//   | ver:u8 | cmd:u8 | length:u16 LE | sid:u32 LE | payload... |
//
// Version 2 adds the UPD command carrying per-stream flow control:
//   | consumed:u32 LE | window:u32 LE |
// ============================================================

#include "../common/platform.hpp"

namespace mux {

static constexpr size_t HEADER_SIZE     = 8;
static constexpr size_t UPD_SIZE        = 8;
static constexpr int    MAX_VERSION     = 2;
static constexpr u32    INITIAL_PEER_WINDOW = 262144;
static constexpr int    MAX_FRAME_SIZE  = 65535;

enum class Cmd : u8 {
    SYN = 0,  // stream open
    FIN = 1,  // stream close (EOF)
    PSH = 2,  // data push
    NOP = 3,  // keepalive
    UPD = 4,  // v2: window update
};

struct FrameHeader {
    u8  version{1};
    Cmd cmd{Cmd::NOP};
    u16 length{0};
    u32 sid{0};
};

inline void put_u16le(u8* p, u16 v) {
    p[0] = (u8)(v);
    p[1] = (u8)(v >> 8);
}

inline void put_u32le(u8* p, u32 v) {
    p[0] = (u8)(v);
    p[1] = (u8)(v >> 8);
    p[2] = (u8)(v >> 16);
    p[3] = (u8)(v >> 24);
}

inline u16 get_u16le(const u8* p) {
    return (u16)(p[0] | (p[1] << 8));
}

inline u32 get_u32le(const u8* p) {
    return (u32)p[0] | ((u32)p[1] << 8) | ((u32)p[2] << 16) | ((u32)p[3] << 24);
}

inline void encode_header(const FrameHeader& h, u8 buf[HEADER_SIZE]) {
    buf[0] = h.version;
    buf[1] = static_cast<u8>(h.cmd);
    put_u16le(buf + 2, h.length);
    put_u32le(buf + 4, h.sid);
}

inline FrameHeader decode_header(const u8 buf[HEADER_SIZE]) {
    FrameHeader h;
    h.version = buf[0];
    h.cmd     = static_cast<Cmd>(buf[1]);
    h.length  = get_u16le(buf + 2);
    h.sid     = get_u32le(buf + 4);
    return h;
}

inline bool valid_cmd(u8 version, Cmd cmd) {
    switch (cmd) {
        case Cmd::SYN:
        case Cmd::FIN:
        case Cmd::PSH:
        case Cmd::NOP:
            return true;
        case Cmd::UPD:
            return version >= 2;
    }
    return false;
}

} // namespace mux
