// ============================================================
// socket.cpp -- TcpSocket / UdpSocket implementation
// ============================================================

#include "socket.hpp"
#include "utils.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <memory>
#include <algorithm>
#include <climits>

// Buffer size for SO_SNDBUF / SO_RCVBUF on accepted/local TCP sockets = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

#ifdef _WIN32
#  define SEND_FLAGS 0
#else
#  define SEND_FLAGS MSG_NOSIGNAL
#endif

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { if (ai) freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string& host, u16 port, int socktype, bool passive) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = socktype;
    if (passive) hints.ai_flags = AI_PASSIVE;

    const char* node = nullptr;
    if (!host.empty() && !(passive && host == "0.0.0.0")) node = host.c_str();
    if (passive && node == nullptr) hints.ai_family = AF_INET;

    std::string service = std::to_string(port);
    addrinfo* res = nullptr;
    int rc = getaddrinfo(node, service.c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error("cannot resolve " + utils::join_host_port(host, port) +
                                 ": " + gai_strerror(rc));
    }
    return AddrInfoPtr(res);
}

std::string sockaddr_str(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&ss);
        if (inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) {
            return utils::join_host_port(buf, ntohs(in->sin_port));
        }
    } else if (ss.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) {
            return utils::join_host_port(buf, ntohs(in6->sin6_port));
        }
    }
    return "unknown";
}

std::string peer_of(socket_t fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (getpeername(fd, (sockaddr*)&ss, &len) == 0) return sockaddr_str(ss);
    return "unknown";
}

std::string local_of(socket_t fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (getsockname(fd, (sockaddr*)&ss, &len) == 0) return sockaddr_str(ss);
    return "unknown";
}

bool set_int_opt(socket_t fd, int level, int name, int value) {
#ifdef _WIN32
    return setsockopt(fd, level, name, (const char*)&value, sizeof(value)) == 0;
#else
    return setsockopt(fd, level, name, &value, sizeof(value)) == 0;
#endif
}

} // namespace

// ============================================================
// TcpSocket
// ============================================================

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    set_int_opt(fd_, SOL_SOCKET, SO_REUSEADDR, 1);
}

void TcpSocket::tune() {
    set_int_opt(fd_, IPPROTO_TCP, TCP_NODELAY,  1);
    set_int_opt(fd_, SOL_SOCKET,  SO_KEEPALIVE, 1);
    set_int_opt(fd_, SOL_SOCKET,  SO_SNDBUF,    SOCKET_BUF_SIZE);
    set_int_opt(fd_, SOL_SOCKET,  SO_RCVBUF,    SOCKET_BUF_SIZE);
}

void TcpSocket::connect(const std::string& host, u16 port) {
    close();
    AddrInfoPtr res = resolve(host, port, SOCK_STREAM, false);
    std::string last_err = "no usable address";
    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ == INVALID_SOCKET_VAL) {
            last_err = "socket() failed: " + socket_error_str(last_socket_error());
            continue;
        }
        if (::connect(fd_, ai->ai_addr, (socklen_t)ai->ai_addrlen) == 0) {
            tune();
            return;
        }
        last_err = "connect() failed: " + socket_error_str(last_socket_error());
        close();
    }
    throw std::runtime_error(last_err);
}

void TcpSocket::bind_and_listen(const std::string& host, u16 port, int backlog) {
    close();
    AddrInfoPtr res = resolve(host, port, SOCK_STREAM, true);
    std::string last_err = "no usable address";
    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ == INVALID_SOCKET_VAL) {
            last_err = "socket() failed: " + socket_error_str(last_socket_error());
            continue;
        }
        apply_socket_opts();
        if (::bind(fd_, ai->ai_addr, (socklen_t)ai->ai_addrlen) == SOCKET_ERROR_VAL) {
            last_err = "bind() failed: " + socket_error_str(last_socket_error());
            close();
            continue;
        }
        if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
            last_err = "listen() failed: " + socket_error_str(last_socket_error());
            close();
            continue;
        }
        return;
    }
    throw std::runtime_error(last_err);
}

TcpSocket TcpSocket::accept() {
    sockaddr_storage peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), SEND_FLAGS);
#else
        ssize_t sent = ::send(fd_, p, remaining, SEND_FLAGS);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
#ifdef _WIN32
        int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, buf, len, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
#ifndef _WIN32
        if (err == EINTR) continue;
#endif
        throw std::runtime_error("recv() failed: " + socket_error_str(err));
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        size_t received = recv_some(p, remaining);
        if (received == 0) return false; // clean close
        p += received;
        remaining -= received;
    }
    return true;
}

void TcpSocket::shutdown_read() {
    if (fd_ != INVALID_SOCKET_VAL) ::shutdown(fd_, SHUT_READ_VAL);
}

void TcpSocket::shutdown_write() {
    if (fd_ != INVALID_SOCKET_VAL) ::shutdown(fd_, SHUT_WRITE_VAL);
}

void TcpSocket::shutdown_both() {
    if (fd_ != INVALID_SOCKET_VAL) ::shutdown(fd_, SHUT_BOTH_VAL);
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    return peer_of(fd_);
}

std::string TcpSocket::local_addr() const {
    return local_of(fd_);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

// ============================================================
// UdpSocket
// ============================================================

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::bind(const std::string& host, u16 port) {
    close();
    AddrInfoPtr res = resolve(host, port, SOCK_DGRAM, true);
    std::string last_err = "no usable address";
    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ == INVALID_SOCKET_VAL) {
            last_err = "socket() failed: " + socket_error_str(last_socket_error());
            continue;
        }
        if (::bind(fd_, ai->ai_addr, (socklen_t)ai->ai_addrlen) == 0) return;
        last_err = "bind() failed: " + socket_error_str(last_socket_error());
        close();
    }
    throw std::runtime_error(last_err);
}

void UdpSocket::connect(const std::string& host, u16 port) {
    // A socket from bind() keeps its local address
    const bool bound = fd_ != INVALID_SOCKET_VAL;
    AddrInfoPtr res = resolve(host, port, SOCK_DGRAM, false);
    std::string last_err = "no usable address";
    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        if (!bound) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ == INVALID_SOCKET_VAL) {
                last_err = "socket() failed: " + socket_error_str(last_socket_error());
                continue;
            }
        }
        if (::connect(fd_, ai->ai_addr, (socklen_t)ai->ai_addrlen) == 0) {
#ifdef _WIN32
            u_long nb = 1;
            ioctlsocket(fd_, FIONBIO, &nb);
#else
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
#endif
            return;
        }
        last_err = "connect() failed: " + socket_error_str(last_socket_error());
        if (!bound) close();
    }
    throw std::runtime_error(last_err);
}

bool UdpSocket::set_read_buffer(int bytes) {
    return set_int_opt(fd_, SOL_SOCKET, SO_RCVBUF, bytes);
}

bool UdpSocket::set_write_buffer(int bytes) {
    return set_int_opt(fd_, SOL_SOCKET, SO_SNDBUF, bytes);
}

bool UdpSocket::send(const void* buf, size_t len) {
#ifdef _WIN32
    int sent = ::send(fd_, static_cast<const char*>(buf), (int)len, 0);
#else
    ssize_t sent = ::send(fd_, buf, len, SEND_FLAGS);
#endif
    return sent == (decltype(sent))len;
}

long UdpSocket::recv_nonblocking(void* buf, size_t cap) {
#ifdef _WIN32
    int n = ::recv(fd_, static_cast<char*>(buf), (int)cap, 0);
#else
    ssize_t n = ::recv(fd_, buf, cap, 0);
#endif
    if (n >= 0) return (long)n;
    int err = last_socket_error();
#ifdef _WIN32
    if (would_block(err) || err == WSAECONNRESET) return -1;
#else
    if (would_block(err) || err == EINTR || err == ECONNREFUSED) return -1;
#endif
    throw std::runtime_error("recv() failed: " + socket_error_str(err));
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string UdpSocket::peer_addr() const {
    return peer_of(fd_);
}

std::string UdpSocket::local_addr() const {
    return local_of(fd_);
}
