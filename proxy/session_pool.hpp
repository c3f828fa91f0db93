#pragma once

// ============================================================
// session_pool.hpp -- Fixed-size pool of transport sessions
//
// Slots are filled eagerly by init(). A slot whose session has
// died is replaced lazily by get_or_repair(); repairs of the same
// slot are serialized, so one dead session yields exactly one
// replacement no matter how many dispatchers notice it.
// ============================================================

#include "../common/platform.hpp"
#include "../common/transport.hpp"
#include <vector>
#include <mutex>
#include <memory>
#include <atomic>

class SessionPool {
public:
    SessionPool(std::shared_ptr<SessionFactory> factory,
                TransportOptions opts,
                int size);
    ~SessionPool() = default;

    // Create every slot. All-or-nothing: on failure the sessions created
    // so far are closed and the SessionError is rethrown.
    void init();

    int size() const { return size_; }

    // Round-robin: next slot index in call order
    int next_index() {
        return (int)(rr_counter_.fetch_add(1) % (u64)size_);
    }

    // Return a usable session for slot idx, replacing a dead or missing
    // one first. Blocks while dialing. Throws SessionError.
    std::shared_ptr<TransportSession> get_or_repair(int idx);

    // Current occupant of slot idx (may be null or closed)
    std::shared_ptr<TransportSession> get(int idx) const;

    // Number of slots holding a session that is not closed
    int live_count() const;

    // Close every session and refuse further repairs
    void close_all();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

private:
    std::shared_ptr<SessionFactory>                factory_;
    TransportOptions                               opts_;
    int                                            size_;

    std::vector<std::shared_ptr<TransportSession>> sessions_;
    std::vector<std::mutex>                        repair_mutexes_;
    mutable std::mutex                             mutex_;   // guards sessions_ and closed_
    bool                                           closed_{false};
    std::atomic<u64>                               rr_counter_{0};
};
