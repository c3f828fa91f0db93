#pragma once

// ============================================================
// transport.hpp -- Interfaces between the proxy engine and the
//   tunnel transport (reliable link + stream multiplexer)
//
//   ByteStream        one reliable, ordered, bidirectional byte stream
//   TransportSession  a multiplexed connection to the remote endpoint
//   SessionFactory    dials a new TransportSession
// ============================================================

#include "platform.hpp"
#include <memory>
#include <string>
#include <stdexcept>

// Dial, handshake or multiplexer-config failure while creating a session
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Failure to open a logical stream on a session
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& msg) : std::runtime_error(msg) {}
};

// KCP tuning. nodelay/interval/resend/nc come from the mode preset.
struct KcpOptions {
    int  mtu{1350};
    int  sndwnd{128};
    int  rcvwnd{512};
    int  datashard{10};
    int  parityshard{3};
    bool ack_nodelay{false};
    int  sockbuf{4194304};

    int  nodelay{0};
    int  interval{30};
    int  resend{2};
    int  nc{1};

    int  dead_link{20};   // retransmissions of one segment before the link is dead
};

// Stream multiplexer tuning
struct MuxOptions {
    int version{1};
    int max_receive_buffer{4194304};
    int max_stream_buffer{2097152};
    int max_frame_size{4096};
    int keepalive_secs{10};
    int keepalive_timeout_secs{30};   // close after this long without inbound frames
};

struct TransportOptions {
    std::string remote_addr;   // "host:port"
    KcpOptions  kcp;
    MuxOptions  mux;
};

class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to len bytes; returns 0 at end-of-input, throws on error
    virtual size_t read(void* buf, size_t len) = 0;

    // Write all len bytes or throw
    virtual void write(const void* buf, size_t len) = 0;

    // Idempotent; wakes any thread blocked in read()/write()
    virtual void close() = 0;
};

class TransportSession {
public:
    virtual ~TransportSession() = default;

    // Open one logical stream; throws StreamError
    virtual std::unique_ptr<ByteStream> open_stream() = 0;

    virtual bool is_closed() const = 0;

    // Idempotent; ends every stream opened on this session
    virtual void close() = 0;

    // Human-readable endpoint description for logs
    virtual std::string describe() const = 0;
};

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    // Establish a new session; throws SessionError
    virtual std::shared_ptr<TransportSession> create(const TransportOptions& opts) = 0;
};
