#pragma once

// ============================================================
// proxy_app.hpp -- Proxy controller
//   Stopped --start()--> Running --stop()--> Stopped
//
// Concurrency model:
//   accept thread  -> accepts one socket at a time, picks the
//                     round-robin slot and hands the socket to
//                     the TaskRunner.
//   dispatch task  -> repairs the slot if its session is dead,
//                     then runs a Forwarder to completion.
// start()/stop() are serialized by mutex_; the accept thread and
// dispatch tasks never take it.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/task_runner.hpp"
#include "../common/transport.hpp"
#include "config.hpp"
#include "session_pool.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>

class ProxyApp {
public:
    explicit ProxyApp(std::shared_ptr<SessionFactory> factory,
                      std::shared_ptr<TaskRunner> runner = std::make_shared<ThreadPerTaskRunner>());
    ~ProxyApp();

    // Parse, validate, bind and populate the pool. Returns "" on success,
    // otherwise an error prefixed with the failing phase. Nothing stays
    // allocated on failure.
    std::string start(const std::string& config_json);

    // No-op when not running. Forwarders already in flight unwind on
    // their own once their sessions are closed.
    void stop();

    bool is_running() const { return running_.load(); }

    // Actual bound "host:port" while running, "" otherwise
    std::string local_address() const;

    // Live sessions in the pool, 0 when stopped
    int session_count() const;

    // Effective configuration of the current (or last) run
    ProxyConfig config() const;

    ProxyApp(const ProxyApp&) = delete;
    ProxyApp& operator=(const ProxyApp&) = delete;

private:
    platform::Guard                 platform_guard_;
    std::shared_ptr<SessionFactory> factory_;
    std::shared_ptr<TaskRunner>     runner_;

    mutable std::mutex              mutex_;
    std::atomic<bool>               running_{false};
    std::atomic<bool>               stopping_{false};

    ProxyConfig                     config_;
    std::shared_ptr<SessionPool>    pool_;       // dispatch tasks hold their own reference
    TcpSocket                       listener_;
    std::string                     bound_addr_;
    std::thread                     accept_thread_;
    std::atomic<u64>                conn_counter_{0};

    void accept_loop(std::shared_ptr<SessionPool> pool);
};
