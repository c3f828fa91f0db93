#pragma once

// ============================================================
// kcp_conn.hpp -- Reliable byte stream over UDP using KCP
//
// One updater thread per connection drives the KCP clock, pulls
// datagrams off the socket and wakes blocked readers/writers.
// All KCP state is touched only under mutex_.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/transport.hpp"
#include "fec_frame.hpp"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <string>

struct IKCPCB;

class KcpConn : public ByteStream {
public:
    // sock must already be connected to the remote endpoint
    KcpConn(UdpSocket sock, const KcpOptions& opts, u32 conv);
    ~KcpConn() override;

    size_t read(void* buf, size_t len) override;
    void write(const void* buf, size_t len) override;
    void close() override;

    std::string local_addr() const { return sock_.local_addr(); }
    std::string peer_addr() const  { return sock_.peer_addr(); }

    KcpConn(const KcpConn&) = delete;
    KcpConn& operator=(const KcpConn&) = delete;

private:
    static int output_cb(const char* buf, int len, IKCPCB* kcp, void* user);

    void update_loop();
    void send_packet(const u8* buf, size_t len);
    void drain_socket(std::vector<u8>& dgram);

    UdpSocket               sock_;
    KcpOptions              opts_;
    fec::Encoder            fec_;
    std::vector<u8>         out_buf_;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    IKCPCB*                 kcp_{nullptr};
    std::vector<u8>         rx_;
    size_t                  rx_off_{0};
    bool                    closed_{false};
    bool                    dead_{false};

    std::thread             updater_;
};
