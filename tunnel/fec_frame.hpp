#pragma once

// ============================================================
// fec_frame.hpp -- kcp-go compatible FEC packet framing
//
// With FEC enabled every datagram carries
//   | seqid:u32 LE | flag:u16 LE | size:u16 LE | kcp packet... |
// where flag is 0xf1 for data shards and 0xf2 for parity shards and
// size counts the kcp packet plus the size field itself.
//
// Only data shards are produced. Sequence ids still skip the parity
// slots of each shard group so the peer's decoder groups shards
// correctly. Incoming parity shards are dropped; KCP retransmission
// covers any loss they would have repaired.
// ============================================================

#include "../common/platform.hpp"
#include "mux_frame.hpp"
#include <vector>
#include <cstring>

namespace fec {

static constexpr size_t HEADER_SIZE       = 6;
static constexpr size_t HEADER_SIZE_PLUS2 = 8;
static constexpr u16    TYPE_DATA         = 0xf1;
static constexpr u16    TYPE_PARITY       = 0xf2;

class Encoder {
public:
    Encoder(int data_shards, int parity_shards)
        : data_shards_(data_shards), parity_shards_(parity_shards)
    {
        if (enabled()) {
            u32 shard_size = (u32)(data_shards_ + parity_shards_);
            paws_ = 0xffffffffu / shard_size * shard_size;
        }
    }

    bool enabled() const { return data_shards_ > 0 && parity_shards_ > 0; }

    // Bytes prepended to every kcp packet
    size_t overhead() const { return enabled() ? HEADER_SIZE_PLUS2 : 0; }

    // Frame one kcp packet into out (replacing its contents)
    void wrap(const u8* pkt, size_t len, std::vector<u8>& out) {
        out.resize(overhead() + len);
        if (enabled()) {
            mux::put_u32le(out.data(), next_);
            mux::put_u16le(out.data() + 4, TYPE_DATA);
            mux::put_u16le(out.data() + 6, (u16)(len + 2));
            next_ = (next_ + 1) % paws_;
            if (++shard_count_ == data_shards_) {
                next_ = (next_ + (u32)parity_shards_) % paws_;
                shard_count_ = 0;
            }
        }
        if (len > 0) std::memcpy(out.data() + overhead(), pkt, len);
    }

    u32 next_seqid() const { return next_; }

private:
    int data_shards_;
    int parity_shards_;
    u32 paws_{0xffffffffu};
    u32 next_{0};
    int shard_count_{0};
};

// Extract the kcp packet from an incoming datagram.
// Returns false for parity shards and malformed datagrams.
inline bool unwrap(bool fec_enabled, const u8* pkt, size_t len,
                   const u8*& kcp_data, size_t& kcp_len) {
    if (!fec_enabled) {
        kcp_data = pkt;
        kcp_len  = len;
        return len > 0;
    }
    if (len < HEADER_SIZE_PLUS2) return false;
    u16 flag = mux::get_u16le(pkt + 4);
    if (flag != TYPE_DATA) return false;
    kcp_data = pkt + HEADER_SIZE_PLUS2;
    kcp_len  = len - HEADER_SIZE_PLUS2;
    return kcp_len > 0;
}

} // namespace fec
