// ============================================================
// kcp_dialer.cpp -- KcpSessionFactory implementation
// ============================================================

#include "kcp_dialer.hpp"
#include "kcp_conn.hpp"
#include "mux_session.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../common/utils.hpp"
#include <string>

std::shared_ptr<TransportSession> KcpSessionFactory::create(const TransportOptions& opts) {
    std::string host;
    int port = 0;
    if (!utils::split_host_port(opts.remote_addr, host, port) || !utils::validate_port(port)) {
        throw SessionError("invalid remote address: " + opts.remote_addr);
    }

    // Reject unusable mux settings before touching the network
    mux::verify(opts.mux);

    UdpSocket sock;
    try {
        sock.connect(host, (u16)port);
    } catch (const std::exception& e) {
        throw SessionError("dial " + opts.remote_addr + ": " + e.what());
    }

    if (!sock.set_read_buffer(opts.kcp.sockbuf)) {
        LOG_WARN("SetReadBuffer: " + socket_error_str(last_socket_error()));
    }
    if (!sock.set_write_buffer(opts.kcp.sockbuf)) {
        LOG_WARN("SetWriteBuffer: " + socket_error_str(last_socket_error()));
    }

    std::string desc = sock.local_addr() + " -> " + sock.peer_addr();

    std::unique_ptr<KcpConn> conn;
    try {
        conn = std::make_unique<KcpConn>(std::move(sock), opts.kcp, utils::random_u32());
    } catch (const std::exception& e) {
        throw SessionError("kcp setup for " + opts.remote_addr + ": " + e.what());
    }

    std::shared_ptr<MuxSession> session = MuxSession::client(std::move(conn), opts.mux, desc);
    LOG_INFO("Session created: " + desc);
    return session;
}
