// ============================================================
// proxy_app.cpp -- ProxyApp implementation
// ============================================================

#include "proxy_app.hpp"
#include "forwarder.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>

// Pause after a failed accept() so a persistent error (e.g. EMFILE)
// does not spin the accept thread.
static constexpr int ACCEPT_RETRY_DELAY_MS = 50;

// Runs on the TaskRunner: bind the connection to its slot, then forward.
static void dispatch(TcpSocket sock, std::shared_ptr<SessionPool> pool, int idx, u64 conn_id) {
    std::shared_ptr<TransportSession> session;
    try {
        session = pool->get_or_repair(idx);
    } catch (const std::exception& e) {
        LOG_WARN("conn #" + std::to_string(conn_id) + ": no session for slot " +
                 std::to_string(idx) + ": " + e.what());
        sock.close();
        return;
    }

    Forwarder fwd(std::move(sock), std::move(session), conn_id);
    fwd.run();
}

ProxyApp::ProxyApp(std::shared_ptr<SessionFactory> factory,
                   std::shared_ptr<TaskRunner> runner)
    : factory_(std::move(factory)),
      runner_(std::move(runner))
{
}

ProxyApp::~ProxyApp() {
    stop();
}

std::string ProxyApp::start(const std::string& config_json) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_.load()) {
        return "Proxy already running";
    }

    ProxyConfig cfg;
    try {
        cfg = config::parse(config_json);
    } catch (const ConfigError& e) {
        return std::string("Config Error: ") + e.what();
    }
    config::apply_defaults(cfg);
    config::apply_mode(cfg);
    try {
        config::validate(cfg);
    } catch (const ValidateError& e) {
        return std::string("Validate Error: ") + e.what();
    }

    std::string host;
    int port = 0;
    if (!utils::split_host_port(cfg.local_addr, host, port)) {
        return "Listen Error: invalid local address: " + cfg.local_addr;
    }

    TcpSocket listener;
    try {
        listener.bind_and_listen(host, (u16)port);
    } catch (const std::exception& e) {
        return std::string("Listen Error: ") + e.what();
    }

    std::shared_ptr<SessionPool> pool;
    try {
        pool = std::make_shared<SessionPool>(factory_, cfg.transport, cfg.conn);
        pool->init();
    } catch (const std::exception& e) {
        listener.close();
        return std::string("Session Error: ") + e.what();
    }

    config_     = cfg;
    pool_       = pool;
    listener_   = std::move(listener);
    bound_addr_ = listener_.local_addr();
    stopping_.store(false);

    try {
        accept_thread_ = std::thread([this, pool]() { accept_loop(pool); });
    } catch (const std::exception& e) {
        pool_->close_all();
        pool_.reset();
        listener_.close();
        bound_addr_.clear();
        return std::string("Listen Error: ") + e.what();
    }
    running_.store(true);

    LOG_INFO("KCP proxy started on " + bound_addr_ + " -> " + cfg.transport.remote_addr +
             " (mode: " + config::mode_name(cfg.mode) + ", conn: " + std::to_string(cfg.conn) + ")");
    return "";
}

void ProxyApp::stop() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!running_.load()) return;

    stopping_.store(true);
    // Wakes a blocked accept(); close() alone does not on Linux
    listener_.shutdown_both();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.close();

    pool_->close_all();
    pool_.reset();
    bound_addr_.clear();
    running_.store(false);

    LOG_INFO("KCP proxy stopped");
}

std::string ProxyApp::local_address() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return bound_addr_;
}

int ProxyApp::session_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pool_ ? pool_->live_count() : 0;
}

ProxyConfig ProxyApp::config() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return config_;
}

// ---------------------------------------------------------------
// accept_loop
//   Slot selection happens here, in accept order; everything that
//   may block (repair, stream open, copying) runs on the TaskRunner.
// ---------------------------------------------------------------
void ProxyApp::accept_loop(std::shared_ptr<SessionPool> pool) {
    while (!stopping_.load()) {
        try {
            TcpSocket sock = listener_.accept();
            if (stopping_.load()) break;
            sock.tune();

            int idx = pool->next_index();
            u64 conn_id = ++conn_counter_;
            LOG_DEBUG("conn #" + std::to_string(conn_id) + ": accepted " +
                      sock.peer_addr() + " -> slot " + std::to_string(idx));

            // std::function needs a copyable callable
            auto shared_sock = std::make_shared<TcpSocket>(std::move(sock));
            runner_->spawn([shared_sock, pool, idx, conn_id]() {
                dispatch(std::move(*shared_sock), pool, idx, conn_id);
            });
        } catch (const std::exception& e) {
            if (stopping_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_RETRY_DELAY_MS));
        }
    }
}
