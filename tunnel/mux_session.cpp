// ============================================================
// mux_session.cpp -- MuxSession / MuxStream implementation
// ============================================================

#include "mux_session.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>

void mux::verify(const MuxOptions& o) {
    if (o.version < 1 || o.version > MAX_VERSION) {
        throw SessionError("unsupported protocol version " + std::to_string(o.version));
    }
    if (o.keepalive_secs <= 0) {
        throw SessionError("keep-alive interval must be positive");
    }
    if (o.keepalive_timeout_secs <= 0) {
        throw SessionError("keep-alive timeout must be positive");
    }
    if (o.keepalive_secs > o.keepalive_timeout_secs) {
        throw SessionError("keep-alive interval must not be larger than keep-alive timeout (" +
                           std::to_string(o.keepalive_timeout_secs) + "s)");
    }
    if (o.max_frame_size <= 0) {
        throw SessionError("max frame size must be positive");
    }
    if (o.max_frame_size > MAX_FRAME_SIZE) {
        throw SessionError("max frame size must not be larger than 65535");
    }
    if (o.max_receive_buffer <= 0) {
        throw SessionError("max receive buffer must be positive");
    }
    if (o.max_stream_buffer <= 0) {
        throw SessionError("max stream buffer must be positive");
    }
    if (o.max_stream_buffer > o.max_receive_buffer) {
        throw SessionError("max stream buffer must not be larger than max receive buffer");
    }
}

// ============================================================
// MuxStream
// ============================================================

class MuxStream : public ByteStream {
public:
    MuxStream(std::shared_ptr<MuxSession> session,
              std::shared_ptr<MuxSession::StreamState> st)
        : session_(std::move(session)), st_(std::move(st)) {}

    ~MuxStream() override { close(); }

    size_t read(void* buf, size_t len) override;
    void write(const void* buf, size_t len) override;
    void close() override;

private:
    std::shared_ptr<MuxSession>              session_;
    std::shared_ptr<MuxSession::StreamState> st_;
};

size_t MuxStream::read(void* buf, size_t len) {
    if (len == 0) return 0;

    const MuxOptions& opts = session_->opts_;
    size_t n = 0;
    bool send_upd = false;
    u32 consumed = 0;
    {
        std::unique_lock<std::mutex> lk(st_->mutex);
        st_->cv.wait(lk, [this] {
            return st_->buffered > 0 || st_->remote_fin ||
                   st_->local_closed || session_->is_closed();
        });
        if (st_->local_closed || st_->buffered == 0) return 0;

        u8* out = static_cast<u8*>(buf);
        while (n < len && !st_->chunks.empty()) {
            std::vector<u8>& front = st_->chunks.front();
            size_t take = std::min(front.size() - st_->head_offset, len - n);
            std::memcpy(out + n, front.data() + st_->head_offset, take);
            n += take;
            st_->head_offset += take;
            if (st_->head_offset == front.size()) {
                st_->chunks.pop_front();
                st_->head_offset = 0;
            }
        }
        st_->buffered -= n;

        if (opts.version >= 2) {
            st_->num_read += (u32)n;
            st_->incr += (u32)n;
            if (st_->incr >= (u32)opts.max_stream_buffer / 2) {
                send_upd = true;
                consumed = st_->num_read;
                st_->incr = 0;
            }
        }
    }

    session_->return_tokens(n);

    if (send_upd) {
        u8 upd[mux::UPD_SIZE];
        mux::put_u32le(upd, consumed);
        mux::put_u32le(upd + 4, (u32)opts.max_stream_buffer);
        try {
            session_->write_frame(mux::Cmd::UPD, st_->id, upd, sizeof(upd));
        } catch (const std::exception& e) {
            LOG_DEBUG("mux: window update for stream " + std::to_string(st_->id) +
                      " not sent: " + e.what());
        }
    }
    return n;
}

void MuxStream::write(const void* buf, size_t len) {
    const MuxOptions& opts = session_->opts_;
    const u8* p = static_cast<const u8*>(buf);

    while (len > 0) {
        size_t n = std::min(len, (size_t)opts.max_frame_size);
        {
            std::unique_lock<std::mutex> lk(st_->mutex);
            if (opts.version >= 2) {
                // Wait for the peer to open its window
                st_->cv.wait(lk, [this] {
                    i64 inflight = (i64)(u32)(st_->num_written - st_->peer_consumed);
                    return st_->local_closed || session_->is_closed() ||
                           (i64)st_->peer_window - inflight > 0;
                });
            }
            if (st_->local_closed) {
                throw std::runtime_error("write on closed stream " + std::to_string(st_->id));
            }
            if (session_->is_closed()) {
                throw std::runtime_error("session closed: " + session_->describe());
            }
            if (opts.version >= 2) {
                i64 inflight = (i64)(u32)(st_->num_written - st_->peer_consumed);
                n = std::min(n, (size_t)((i64)st_->peer_window - inflight));
            }
        }

        session_->write_frame(mux::Cmd::PSH, st_->id, p, n);

        {
            std::lock_guard<std::mutex> lk(st_->mutex);
            st_->num_written += (u32)n;
        }
        p   += n;
        len -= n;
    }
}

void MuxStream::close() {
    {
        std::lock_guard<std::mutex> lk(st_->mutex);
        if (st_->local_closed) return;
        st_->local_closed = true;
    }
    st_->cv.notify_all();

    if (!session_->is_closed()) {
        try {
            session_->write_frame(mux::Cmd::FIN, st_->id, nullptr, 0);
        } catch (const std::exception& e) {
            LOG_DEBUG("mux: FIN for stream " + std::to_string(st_->id) +
                      " not sent: " + e.what());
        }
    }
    session_->remove_stream(st_->id);
}

// ============================================================
// MuxSession
// ============================================================

std::shared_ptr<MuxSession> MuxSession::client(std::unique_ptr<ByteStream> link,
                                               const MuxOptions& opts,
                                               std::string description) {
    mux::verify(opts);
    auto session = std::make_shared<MuxSession>(PrivateTag{}, std::move(link), opts,
                                                std::move(description));
    session->start();
    return session;
}

MuxSession::MuxSession(PrivateTag, std::unique_ptr<ByteStream> link, const MuxOptions& opts,
                       std::string description)
    : link_(std::move(link)), opts_(opts), description_(std::move(description))
{}

MuxSession::~MuxSession() {
    close();
    if (recv_thread_.joinable()) recv_thread_.join();
    if (keepalive_thread_.joinable()) keepalive_thread_.join();
}

void MuxSession::start() {
    recv_thread_      = std::thread([this] { recv_loop(); });
    keepalive_thread_ = std::thread([this] { keepalive_loop(); });
}

std::unique_ptr<ByteStream> MuxSession::open_stream() {
    if (closed_.load()) {
        throw StreamError("session closed: " + description_);
    }

    std::shared_ptr<StreamState> st;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (next_id_ > 0xFFFFFFFFu - 2) {
            throw StreamError("stream ids exhausted on " + description_);
        }
        next_id_ += 2;
        st = std::make_shared<StreamState>(next_id_);
        streams_[st->id] = st;
    }

    try {
        write_frame(mux::Cmd::SYN, st->id, nullptr, 0);
    } catch (const std::exception& e) {
        remove_stream(st->id);
        throw StreamError("open stream on " + description_ + ": " + e.what());
    }
    return std::make_unique<MuxStream>(shared_from_this(), st);
}

void MuxSession::close() {
    if (closed_.exchange(true)) return;

    link_->close();
    {
        std::lock_guard<std::mutex> lk(mutex_);
    }
    bucket_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lk(keepalive_mutex_);
    }
    keepalive_cv_.notify_all();
    wake_all_streams();
}

size_t MuxSession::stream_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return streams_.size();
}

void MuxSession::write_frame(mux::Cmd cmd, u32 sid, const void* payload, size_t len) {
    if (len > (size_t)mux::MAX_FRAME_SIZE) {
        throw std::runtime_error("mux frame too large: " + std::to_string(len));
    }
    std::vector<u8> buf(mux::HEADER_SIZE + len);
    mux::FrameHeader h;
    h.version = (u8)opts_.version;
    h.cmd     = cmd;
    h.length  = (u16)len;
    h.sid     = sid;
    mux::encode_header(h, buf.data());
    if (len > 0) std::memcpy(buf.data() + mux::HEADER_SIZE, payload, len);

    try {
        std::lock_guard<std::mutex> lk(write_mutex_);
        if (closed_.load()) throw std::runtime_error("session closed: " + description_);
        link_->write(buf.data(), buf.size());
    } catch (const std::exception&) {
        close();
        throw;
    }
}

bool MuxSession::read_full(void* buf, size_t len) {
    u8* p = static_cast<u8*>(buf);
    while (len > 0) {
        size_t n = link_->read(p, len);
        if (n == 0) return false;
        p   += n;
        len -= n;
    }
    return true;
}

std::shared_ptr<MuxSession::StreamState> MuxSession::find_stream(u32 sid) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = streams_.find(sid);
    return it == streams_.end() ? nullptr : it->second;
}

void MuxSession::route_psh(u32 sid, std::vector<u8> payload) {
    std::shared_ptr<StreamState> st;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = streams_.find(sid);
        if (it == streams_.end()) return; // unknown or closed stream: drop
        st = it->second;

        std::lock_guard<std::mutex> slk(st->mutex);
        if (st->local_closed) return;
        size_t n = payload.size();
        st->chunks.push_back(std::move(payload));
        st->buffered    += n;
        buffered_total_ += n;
    }
    st->cv.notify_all();
}

void MuxSession::wait_for_bucket() {
    std::unique_lock<std::mutex> lk(mutex_);
    bucket_cv_.wait(lk, [this] {
        return buffered_total_ < (size_t)opts_.max_receive_buffer || closed_.load();
    });
}

void MuxSession::return_tokens(size_t n) {
    if (n == 0) return;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        buffered_total_ -= std::min(n, buffered_total_);
    }
    bucket_cv_.notify_all();
}

void MuxSession::remove_stream(u32 sid) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = streams_.find(sid);
        if (it == streams_.end()) return;
        std::shared_ptr<StreamState> st = it->second;
        streams_.erase(it);

        std::lock_guard<std::mutex> slk(st->mutex);
        dropped = st->buffered;
        st->chunks.clear();
        st->head_offset = 0;
        st->buffered    = 0;
    }
    return_tokens(dropped);
}

void MuxSession::wake_all_streams() {
    std::vector<std::shared_ptr<StreamState>> all;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        all.reserve(streams_.size());
        for (auto& kv : streams_) all.push_back(kv.second);
    }
    for (auto& st : all) {
        {
            std::lock_guard<std::mutex> slk(st->mutex);
        }
        st->cv.notify_all();
    }
}

void MuxSession::recv_loop() {
    u8 hdr_buf[mux::HEADER_SIZE];
    try {
        while (!closed_.load()) {
            if (!read_full(hdr_buf, mux::HEADER_SIZE)) break;
            mux::FrameHeader h = mux::decode_header(hdr_buf);
            if (h.version != (u8)opts_.version || !mux::valid_cmd(h.version, h.cmd)) {
                LOG_WARN("mux: invalid frame (ver=" + std::to_string(h.version) +
                         " cmd=" + std::to_string((int)h.cmd) + ") from " + description_);
                break;
            }
            data_ready_.store(true);

            if (h.cmd == mux::Cmd::PSH) {
                if (h.length == 0) continue;
                std::vector<u8> payload(h.length);
                if (!read_full(payload.data(), payload.size())) break;
                route_psh(h.sid, std::move(payload));
                wait_for_bucket();
            } else if (h.cmd == mux::Cmd::FIN) {
                std::shared_ptr<StreamState> st = find_stream(h.sid);
                if (st) {
                    {
                        std::lock_guard<std::mutex> slk(st->mutex);
                        st->remote_fin = true;
                    }
                    st->cv.notify_all();
                }
            } else if (h.cmd == mux::Cmd::UPD) {
                u8 upd[mux::UPD_SIZE];
                if (!read_full(upd, sizeof(upd))) break;
                std::shared_ptr<StreamState> st = find_stream(h.sid);
                if (st) {
                    {
                        std::lock_guard<std::mutex> slk(st->mutex);
                        st->peer_consumed = mux::get_u32le(upd);
                        st->peer_window   = mux::get_u32le(upd + 4);
                    }
                    st->cv.notify_all();
                }
            } else if (h.cmd == mux::Cmd::SYN) {
                // Client sessions do not accept peer-initiated streams
                LOG_DEBUG("mux: ignoring peer stream " + std::to_string(h.sid) +
                          " on " + description_);
            }
        }
    } catch (const std::exception& e) {
        if (!closed_.load()) {
            LOG_DEBUG("mux: link read failed on " + description_ + ": " + e.what());
        }
    }
    close();
}

void MuxSession::keepalive_loop() {
    using clock = std::chrono::steady_clock;
    const auto interval = std::chrono::seconds(opts_.keepalive_secs);
    const auto timeout  = std::chrono::seconds(opts_.keepalive_timeout_secs);
    auto next_ping  = clock::now() + interval;
    auto next_check = clock::now() + timeout;

    std::unique_lock<std::mutex> lk(keepalive_mutex_);
    while (!closed_.load()) {
        keepalive_cv_.wait_until(lk, std::min(next_ping, next_check),
                                 [this] { return closed_.load(); });
        if (closed_.load()) break;

        auto now = clock::now();
        if (now >= next_ping) {
            lk.unlock();
            try {
                write_frame(mux::Cmd::NOP, 0, nullptr, 0);
            } catch (const std::exception& e) {
                LOG_DEBUG("mux: keepalive not sent on " + description_ + ": " + e.what());
            }
            lk.lock();
            next_ping = now + interval;
        }
        if (now >= next_check) {
            // A full receive budget means recv_loop is parked waiting for a
            // slow reader; silence then says nothing about the peer.
            bool bucket_full;
            {
                std::lock_guard<std::mutex> blk(mutex_);
                bucket_full = buffered_total_ >= (size_t)opts_.max_receive_buffer;
            }
            if (!data_ready_.exchange(false) && !bucket_full) {
                LOG_WARN("mux: keepalive timeout on " + description_);
                lk.unlock();
                close();
                return;
            }
            next_check = now + timeout;
        }
    }
}
