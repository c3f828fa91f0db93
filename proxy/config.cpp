// ============================================================
// config.cpp -- Proxy configuration implementation
// ============================================================

#include "config.hpp"
#include "../common/utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = it->template get<T>();
}

void default_if_unset(int& field, int value) {
    if (field <= 0) field = value;
}

} // namespace

namespace config {

Mode parse_mode(const std::string& name) {
    if (name == "normal") return Mode::Normal;
    if (name == "fast2")  return Mode::Fast2;
    if (name == "fast3")  return Mode::Fast3;
    return Mode::Fast;
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "normal";
        case Mode::Fast:   return "fast";
        case Mode::Fast2:  return "fast2";
        case Mode::Fast3:  return "fast3";
    }
    return "fast";
}

ModeParams mode_params(Mode mode) {
    switch (mode) {
        case Mode::Normal: return {0, 40, 2, 1};
        case Mode::Fast:   return {0, 30, 2, 1};
        case Mode::Fast2:  return {1, 20, 2, 1};
        case Mode::Fast3:  return {1, 10, 2, 1};
    }
    return {0, 30, 2, 1};
}

ProxyConfig parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    // Start from zero values; apply_defaults() fills them in
    ProxyConfig cfg;
    KcpOptions& kcp = cfg.transport.kcp;
    MuxOptions& mux = cfg.transport.mux;
    kcp = KcpOptions{0, 0, 0, 0, 0, false, 0, 0, 0, 0, 0};
    mux = MuxOptions{0, 0, 0, 0, 0};

    try {
        read_field(j, "localaddr",   cfg.local_addr);
        read_field(j, "localport",   cfg.local_port);
        read_field(j, "remoteaddr",  cfg.transport.remote_addr);
        read_field(j, "mode",        cfg.mode_name);
        read_field(j, "conn",        cfg.conn);

        read_field(j, "mtu",         kcp.mtu);
        read_field(j, "sndwnd",      kcp.sndwnd);
        read_field(j, "rcvwnd",      kcp.rcvwnd);
        read_field(j, "datashard",   kcp.datashard);
        read_field(j, "parityshard", kcp.parityshard);
        read_field(j, "acknodelay",  kcp.ack_nodelay);
        read_field(j, "sockbuf",     kcp.sockbuf);

        read_field(j, "smuxver",     mux.version);
        read_field(j, "smuxbuf",     mux.max_receive_buffer);
        read_field(j, "streambuf",   mux.max_stream_buffer);
        read_field(j, "framesize",   mux.max_frame_size);
        read_field(j, "keepalive",   mux.keepalive_secs);
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
    return cfg;
}

void apply_defaults(ProxyConfig& cfg) {
    if (cfg.local_addr.empty()) {
        int port = cfg.local_port > 0 ? cfg.local_port : DEFAULT_LOCAL_PORT;
        cfg.local_addr = utils::join_host_port(DEFAULT_LOCAL_HOST, port);
    }
    default_if_unset(cfg.conn, 1);

    KcpOptions& kcp = cfg.transport.kcp;
    default_if_unset(kcp.mtu,         1350);
    default_if_unset(kcp.sndwnd,      128);
    default_if_unset(kcp.rcvwnd,      512);
    default_if_unset(kcp.datashard,   10);
    default_if_unset(kcp.parityshard, 3);
    default_if_unset(kcp.sockbuf,     4194304);

    MuxOptions& mux = cfg.transport.mux;
    default_if_unset(mux.version,            1);
    default_if_unset(mux.max_receive_buffer, 4194304);
    default_if_unset(mux.max_stream_buffer,  2097152);
    default_if_unset(mux.max_frame_size,     4096);
    default_if_unset(mux.keepalive_secs,     10);

    if (cfg.mode_name.empty()) cfg.mode_name = "fast";
}

void apply_mode(ProxyConfig& cfg) {
    cfg.mode = parse_mode(cfg.mode_name);
    ModeParams p = mode_params(cfg.mode);
    KcpOptions& kcp = cfg.transport.kcp;
    kcp.nodelay  = p.nodelay;
    kcp.interval = p.interval;
    kcp.resend   = p.resend;
    kcp.nc       = p.nc;
}

void validate(const ProxyConfig& cfg) {
    const std::string& remote = cfg.transport.remote_addr;
    if (remote.empty()) {
        throw ValidateError("remoteaddr is required");
    }
    if (cfg.conn <= 0) {
        throw ValidateError("conn must be greater than 0");
    }
    if (cfg.transport.mux.version > MAX_SMUX_VERSION) {
        throw ValidateError("unsupported smux version: " +
                            std::to_string(cfg.transport.mux.version));
    }
}

} // namespace config
