// ============================================================
// forwarder.cpp
// ============================================================

#include "forwarder.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <thread>
#include <vector>

Forwarder::Forwarder(TcpSocket local,
                     std::shared_ptr<TransportSession> session,
                     u64 conn_id)
    : local_(std::move(local)),
      session_(std::move(session)),
      conn_id_(conn_id)
{
    peer_ = local_.peer_addr();
}

std::string Forwarder::tag() const {
    return "conn #" + std::to_string(conn_id_) + " (" + peer_ + ")";
}

void Forwarder::run() {
    std::unique_ptr<ByteStream> stream;
    try {
        stream = session_->open_stream();
    } catch (const std::exception& e) {
        LOG_WARN(tag() + ": open stream failed: " + e.what());
        local_.close();
        session_.reset();
        return;
    }
    session_.reset();
    LOG_DEBUG(tag() + ": stream opened");

    std::thread down;
    try {
        down = std::thread([this, &stream]() {
            copy_stream_to_local(*stream);
            // Remote finished: stop reading from the local client but let
            // anything still in flight towards it drain.
            local_.shutdown_read();
        });
    } catch (const std::exception& e) {
        LOG_ERROR(tag() + ": cannot start copy thread: " + e.what());
        stream->close();
        local_.close();
        return;
    }

    copy_local_to_stream(*stream);
    stream->close();

    down.join();

    stream->close();
    local_.close();
    LOG_DEBUG(tag() + ": closed, up " + utils::format_bytes(bytes_up()) +
              ", down " + utils::format_bytes(bytes_down()));
}

void Forwarder::copy_stream_to_local(ByteStream& stream) {
    std::vector<u8> buf(COPY_BUF_SIZE);
    try {
        for (;;) {
            size_t n = stream.read(buf.data(), buf.size());
            if (n == 0) return;
            local_.send_all(buf.data(), n);
            bytes_down_ += n;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG(tag() + ": stream -> local: " + e.what());
    }
}

void Forwarder::copy_local_to_stream(ByteStream& stream) {
    std::vector<u8> buf(COPY_BUF_SIZE);
    try {
        for (;;) {
            size_t n = local_.recv_some(buf.data(), buf.size());
            if (n == 0) return;
            stream.write(buf.data(), n);
            bytes_up_ += n;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG(tag() + ": local -> stream: " + e.what());
    }
}
