#pragma once

// ============================================================
// forwarder.hpp -- Full-duplex relay between one accepted local
//   connection and one logical stream on a transport session
//
//   stream -> local   ends: local read-half is shut down
//   local  -> stream  ends: stream is closed (FIN to the peer)
// run() returns once both directions are done; the stream and
// the local socket are closed on every path.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/transport.hpp"
#include <memory>
#include <atomic>
#include <string>

class Forwarder {
public:
    static constexpr size_t COPY_BUF_SIZE = 32 * 1024;

    Forwarder(TcpSocket local,
              std::shared_ptr<TransportSession> session,
              u64 conn_id);

    // Blocks until forwarding completes. Never throws for
    // per-connection failures; they are logged.
    void run();

    u64 bytes_up()   const { return bytes_up_.load(); }    // local -> stream
    u64 bytes_down() const { return bytes_down_.load(); }  // stream -> local

    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

private:
    TcpSocket                         local_;
    std::shared_ptr<TransportSession> session_;   // borrowed for open_stream()
    u64                               conn_id_;
    std::string                       peer_;

    std::atomic<u64>                  bytes_up_{0};
    std::atomic<u64>                  bytes_down_{0};

    void copy_stream_to_local(ByteStream& stream);
    void copy_local_to_stream(ByteStream& stream);

    std::string tag() const;
};
