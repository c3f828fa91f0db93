#pragma once

// ============================================================
// mux_session.hpp -- Client side of an smux-compatible stream
//   multiplexer running over one reliable ByteStream
//
// Threads:
//   recv_loop()      reads frames from the link and routes them
//                    to per-stream buffers
//   keepalive_loop() sends NOP every keepalive interval and closes
//                    the session when nothing arrived for the
//                    keepalive timeout
//
// Streams keep the session alive (shared_ptr); the session joins its
// own threads on destruction.
// ============================================================

#include "../common/platform.hpp"
#include "../common/transport.hpp"
#include "mux_frame.hpp"
#include <memory>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <deque>
#include <vector>
#include <thread>
#include <atomic>
#include <string>

namespace mux {

// Throws SessionError if the options cannot drive a session
void verify(const MuxOptions& opts);

} // namespace mux

class MuxSession : public TransportSession,
                   public std::enable_shared_from_this<MuxSession> {
public:
    // Takes ownership of link. Verifies opts (throws SessionError) and
    // starts the background threads.
    static std::shared_ptr<MuxSession> client(std::unique_ptr<ByteStream> link,
                                              const MuxOptions& opts,
                                              std::string description);
    ~MuxSession() override;

private:
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    // Reachable only through client()
    MuxSession(PrivateTag, std::unique_ptr<ByteStream> link, const MuxOptions& opts,
               std::string description);

    std::unique_ptr<ByteStream> open_stream() override;
    bool is_closed() const override { return closed_.load(); }
    void close() override;
    std::string describe() const override { return description_; }

    // Streams currently registered (opened and not yet closed locally)
    size_t stream_count() const;

    MuxSession(const MuxSession&) = delete;
    MuxSession& operator=(const MuxSession&) = delete;

private:
    friend class MuxStream;

    struct StreamState {
        explicit StreamState(u32 sid) : id(sid) {}

        const u32 id;
        std::mutex mutex;
        std::condition_variable cv;

        std::deque<std::vector<u8>> chunks;
        size_t head_offset{0};
        size_t buffered{0};

        bool remote_fin{false};
        bool local_closed{false};

        // v2 flow control
        u32 num_written{0};
        u32 peer_consumed{0};
        u32 peer_window{mux::INITIAL_PEER_WINDOW};
        u32 num_read{0};
        u32 incr{0};
    };

    void start();
    void recv_loop();
    void keepalive_loop();

    // Serialised write of one frame; closes the session and throws on link failure
    void write_frame(mux::Cmd cmd, u32 sid, const void* payload, size_t len);

    bool read_full(void* buf, size_t len);
    void route_psh(u32 sid, std::vector<u8> payload);
    void wait_for_bucket();
    void return_tokens(size_t n);
    void remove_stream(u32 sid);
    std::shared_ptr<StreamState> find_stream(u32 sid);
    void wake_all_streams();

    std::unique_ptr<ByteStream> link_;
    MuxOptions                  opts_;
    std::string                 description_;

    mutable std::mutex          mutex_;          // streams_, next_id_, buffered_total_
    std::condition_variable     bucket_cv_;
    std::unordered_map<u32, std::shared_ptr<StreamState>> streams_;
    u32                         next_id_{1};
    size_t                      buffered_total_{0};

    std::mutex                  write_mutex_;

    std::mutex                  keepalive_mutex_;
    std::condition_variable     keepalive_cv_;

    std::atomic<bool>           closed_{false};
    std::atomic<bool>           data_ready_{false};

    std::thread                 recv_thread_;
    std::thread                 keepalive_thread_;
};
