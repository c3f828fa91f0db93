// ============================================================
// kcp_conn.cpp -- KcpConn implementation
// ============================================================

#include "kcp_conn.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <ikcp.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

// Largest datagram we expect to receive
static constexpr size_t MAX_DATAGRAM = 65536;

// Segments handed to ikcp_send per call stay well under IKCP_WND_RCV
static constexpr size_t SEND_SEGMENTS_PER_CALL = 32;

KcpConn::KcpConn(UdpSocket sock, const KcpOptions& opts, u32 conv)
    : sock_(std::move(sock)),
      opts_(opts),
      fec_(opts.datashard, opts.parityshard)
{
    kcp_ = ikcp_create(conv, this);
    if (!kcp_) {
        throw std::runtime_error("ikcp_create failed");
    }
    ikcp_setoutput(kcp_, &KcpConn::output_cb);
    kcp_->stream = 1;
    ikcp_nodelay(kcp_, opts_.nodelay, opts_.interval, opts_.resend, opts_.nc);
    ikcp_wndsize(kcp_, opts_.sndwnd, opts_.rcvwnd);
    ikcp_setmtu(kcp_, opts_.mtu - (int)fec_.overhead());
    kcp_->dead_link = (IUINT32)opts_.dead_link;

    updater_ = std::thread([this] { update_loop(); });
}

KcpConn::~KcpConn() {
    close();
    if (updater_.joinable()) updater_.join();
    ikcp_release(kcp_);
}

int KcpConn::output_cb(const char* buf, int len, IKCPCB* /*kcp*/, void* user) {
    static_cast<KcpConn*>(user)->send_packet(reinterpret_cast<const u8*>(buf), (size_t)len);
    return 0;
}

// Called from ikcp_flush/ikcp_update with mutex_ held
void KcpConn::send_packet(const u8* buf, size_t len) {
    fec_.wrap(buf, len, out_buf_);
    if (!sock_.send(out_buf_.data(), out_buf_.size())) {
        // UDP send failures are transient; KCP retransmits
        LOG_DEBUG("kcp: datagram send failed: " + socket_error_str(last_socket_error()));
    }
}

size_t KcpConn::read(void* buf, size_t len) {
    if (len == 0) return 0;

    std::unique_lock<std::mutex> lk(mutex_);
    for (;;) {
        if (rx_off_ < rx_.size()) {
            size_t n = std::min(len, rx_.size() - rx_off_);
            std::memcpy(buf, rx_.data() + rx_off_, n);
            rx_off_ += n;
            return n;
        }
        if (closed_) return 0;

        int size = ikcp_peeksize(kcp_);
        if (size > 0) {
            rx_.resize((size_t)size);
            int got = ikcp_recv(kcp_, reinterpret_cast<char*>(rx_.data()), size);
            rx_.resize(got > 0 ? (size_t)got : 0);
            rx_off_ = 0;
            continue;
        }
        if (dead_) {
            throw std::runtime_error("kcp: link to " + sock_.peer_addr() + " is dead");
        }
        cv_.wait(lk);
    }
}

void KcpConn::write(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);

    std::unique_lock<std::mutex> lk(mutex_);
    while (len > 0) {
        cv_.wait(lk, [this] {
            return closed_ || dead_ || ikcp_waitsnd(kcp_) < opts_.sndwnd;
        });
        if (closed_) throw std::runtime_error("kcp: write on closed connection");
        if (dead_)   throw std::runtime_error("kcp: link to " + sock_.peer_addr() + " is dead");

        size_t chunk = std::min(len, (size_t)kcp_->mss * SEND_SEGMENTS_PER_CALL);
        if (ikcp_send(kcp_, p, (int)chunk) < 0) {
            throw std::runtime_error("kcp: ikcp_send rejected " + std::to_string(chunk) + " bytes");
        }
        p   += chunk;
        len -= chunk;

        // Write delay is off: push segments out immediately
        ikcp_flush(kcp_);
    }
}

void KcpConn::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    cv_.notify_all();
}

void KcpConn::drain_socket(std::vector<u8>& dgram) {
    for (;;) {
        long n = sock_.recv_nonblocking(dgram.data(), dgram.size());
        if (n < 0) return;

        const u8* data = nullptr;
        size_t data_len = 0;
        if (!fec::unwrap(fec_.enabled(), dgram.data(), (size_t)n, data, data_len)) continue;

        std::lock_guard<std::mutex> lk(mutex_);
        int rc = ikcp_input(kcp_, reinterpret_cast<const char*>(data), (long)data_len);
        if (rc < 0) {
            LOG_DEBUG("kcp: dropped datagram from " + sock_.peer_addr() +
                      " (ikcp_input=" + std::to_string(rc) + ")");
            continue;
        }
        if (opts_.ack_nodelay) ikcp_flush(kcp_);
    }
}

void KcpConn::update_loop() {
    std::vector<u8> dgram(MAX_DATAGRAM);
    try {
        for (;;) {
            int wait_ms;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (closed_) return;
                u32 now  = utils::clock32_ms();
                u32 next = ikcp_check(kcp_, now);
                wait_ms  = (int)std::min<u32>(next - now, (u32)opts_.interval);
                if (wait_ms < 1) wait_ms = 1;
            }

            if (platform::wait_readable(sock_.native(), wait_ms)) {
                drain_socket(dgram);
            }

            {
                std::lock_guard<std::mutex> lk(mutex_);
                ikcp_update(kcp_, utils::clock32_ms());
                if (kcp_->state == (IUINT32)-1 && !dead_) {
                    LOG_WARN("kcp: dead link to " + sock_.peer_addr());
                    dead_ = true;
                }
            }
            cv_.notify_all();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("kcp: updater for " + sock_.peer_addr() + " stopped: " + e.what());
        {
            std::lock_guard<std::mutex> lk(mutex_);
            dead_ = true;
        }
        cv_.notify_all();
    }
}
