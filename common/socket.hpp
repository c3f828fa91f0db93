#pragma once

// ============================================================
// socket.hpp -- RAII TCP and UDP socket wrappers
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host and connect to remote
    void connect(const std::string& host, u16 port);

    // Server: resolve, bind + listen. Empty host or "0.0.0.0" binds all interfaces.
    void bind_and_listen(const std::string& host, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive up to 'len' bytes; returns 0 on clean close, throws on error
    size_t recv_some(void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Apply TCP performance tuning
    void tune();

    // Half-close helpers. Safe to call from another thread while a
    // blocking call is in progress; errors are ignored (peer may be gone).
    void shutdown_read();
    void shutdown_write();
    void shutdown_both();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer / local address as "ip:port"
    std::string peer_addr() const;
    std::string local_addr() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};

// Connected UDP socket: one remote peer, datagram send/recv.
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Create the socket bound to a local address (port 0 = ephemeral)
    void bind(const std::string& host, u16 port);

    // Resolve host and connect (fixes the peer for send/recv).
    // Reuses the socket from bind() if there is one.
    void connect(const std::string& host, u16 port);

    // Set SO_RCVBUF / SO_SNDBUF; each returns false on failure
    bool set_read_buffer(int bytes);
    bool set_write_buffer(int bytes);

    // Send one datagram; returns false if the kernel rejected it
    bool send(const void* buf, size_t len);

    // Receive one datagram without blocking.
    // Returns the datagram size, or -1 if nothing is queued.
    // Transient ICMP errors (ECONNREFUSED) are reported as -1 too.
    long recv_nonblocking(void* buf, size_t cap);

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    std::string peer_addr() const;
    std::string local_addr() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
