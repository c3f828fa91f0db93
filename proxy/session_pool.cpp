// ============================================================
// session_pool.cpp
// ============================================================

#include "session_pool.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

static int checked_pool_size(int size) {
    if (size <= 0) {
        throw std::invalid_argument("session pool size must be greater than 0");
    }
    return size;
}

SessionPool::SessionPool(std::shared_ptr<SessionFactory> factory,
                         TransportOptions opts,
                         int size)
    : factory_(std::move(factory)),
      opts_(std::move(opts)),
      size_(checked_pool_size(size)),
      sessions_((size_t)size),
      repair_mutexes_((size_t)size)
{
}

void SessionPool::init() {
    std::vector<std::shared_ptr<TransportSession>> created;
    created.reserve((size_t)size_);

    try {
        for (int i = 0; i < size_; ++i) {
            created.push_back(factory_->create(opts_));
            LOG_DEBUG("Session " + std::to_string(i) + " established: " +
                      created.back()->describe());
        }
    } catch (const std::exception&) {
        for (auto& s : created) s->close();
        throw;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    for (int i = 0; i < size_; ++i) {
        sessions_[(size_t)i] = std::move(created[(size_t)i]);
    }
}

std::shared_ptr<TransportSession> SessionPool::get(int idx) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sessions_.at((size_t)idx);
}

std::shared_ptr<TransportSession> SessionPool::get_or_repair(int idx) {
    std::shared_ptr<TransportSession> current = get(idx);
    if (current && !current->is_closed()) return current;

    // One repairer per slot; late arrivals see the replacement
    std::lock_guard<std::mutex> repair_lk(repair_mutexes_.at((size_t)idx));

    std::shared_ptr<TransportSession> dead;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_) throw SessionError("session pool is closed");
        dead = sessions_[(size_t)idx];
        if (dead && !dead->is_closed()) return dead;
    }

    LOG_INFO("Session " + std::to_string(idx) + " is dead, reconnecting...");
    std::shared_ptr<TransportSession> fresh;
    try {
        fresh = factory_->create(opts_);
    } catch (const std::exception& e) {
        LOG_WARN("Session " + std::to_string(idx) + " repair failed: " + e.what());
        throw;
    }

    bool installed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!closed_) {
            sessions_[(size_t)idx] = fresh;
            installed = true;
        }
    }
    if (!installed) {
        // close_all() ran while we were dialing
        fresh->close();
        throw SessionError("session pool is closed");
    }

    if (dead) dead->close();
    LOG_INFO("Session " + std::to_string(idx) + " replaced: " + fresh->describe());
    return fresh;
}

int SessionPool::live_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    int n = 0;
    for (auto& s : sessions_) {
        if (s && !s->is_closed()) ++n;
    }
    return n;
}

void SessionPool::close_all() {
    std::vector<std::shared_ptr<TransportSession>> to_close;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
        to_close = sessions_;
    }
    for (auto& s : to_close) {
        if (s) s->close();
    }
}
