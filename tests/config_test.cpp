// ============================================================
// config_test.cpp -- JSON parsing, defaults, modes, validation
// ============================================================

#include "../proxy/config.hpp"
#include <gtest/gtest.h>

static ProxyConfig load(const std::string& json) {
    ProxyConfig cfg = config::parse(json);
    config::apply_defaults(cfg);
    config::apply_mode(cfg);
    return cfg;
}

TEST(ConfigTest, EmptyObjectGetsDefaults) {
    ProxyConfig cfg = load("{}");
    EXPECT_EQ(cfg.local_addr, "127.0.0.1:1080");
    EXPECT_EQ(cfg.conn, 1);
    EXPECT_EQ(cfg.mode_name, "fast");
    EXPECT_EQ(cfg.mode, Mode::Fast);

    const KcpOptions& k = cfg.transport.kcp;
    EXPECT_EQ(k.mtu, 1350);
    EXPECT_EQ(k.sndwnd, 128);
    EXPECT_EQ(k.rcvwnd, 512);
    EXPECT_EQ(k.datashard, 10);
    EXPECT_EQ(k.parityshard, 3);
    EXPECT_EQ(k.sockbuf, 4194304);
    EXPECT_FALSE(k.ack_nodelay);

    const MuxOptions& m = cfg.transport.mux;
    EXPECT_EQ(m.version, 1);
    EXPECT_EQ(m.max_receive_buffer, 4194304);
    EXPECT_EQ(m.max_stream_buffer, 2097152);
    EXPECT_EQ(m.max_frame_size, 4096);
    EXPECT_EQ(m.keepalive_secs, 10);
}

TEST(ConfigTest, ExplicitValuesAreKept) {
    ProxyConfig cfg = load(R"({
        "localaddr": "0.0.0.0:9000", "remoteaddr": "10.0.0.1:4000",
        "mode": "fast3", "conn": 4, "mtu": 1200, "sndwnd": 256, "rcvwnd": 1024,
        "datashard": 0, "parityshard": 0, "acknodelay": true, "sockbuf": 1048576,
        "smuxver": 2, "smuxbuf": 8388608, "streambuf": 4194304,
        "framesize": 8192, "keepalive": 5
    })");
    EXPECT_EQ(cfg.local_addr, "0.0.0.0:9000");
    EXPECT_EQ(cfg.transport.remote_addr, "10.0.0.1:4000");
    EXPECT_EQ(cfg.mode, Mode::Fast3);
    EXPECT_EQ(cfg.conn, 4);
    EXPECT_EQ(cfg.transport.kcp.mtu, 1200);
    EXPECT_EQ(cfg.transport.kcp.sndwnd, 256);
    EXPECT_EQ(cfg.transport.kcp.rcvwnd, 1024);
    EXPECT_TRUE(cfg.transport.kcp.ack_nodelay);
    EXPECT_EQ(cfg.transport.kcp.sockbuf, 1048576);
    EXPECT_EQ(cfg.transport.mux.version, 2);
    EXPECT_EQ(cfg.transport.mux.max_receive_buffer, 8388608);
    EXPECT_EQ(cfg.transport.mux.max_stream_buffer, 4194304);
    EXPECT_EQ(cfg.transport.mux.max_frame_size, 8192);
    EXPECT_EQ(cfg.transport.mux.keepalive_secs, 5);
}

TEST(ConfigTest, ZeroShardCountsFallBackToDefaults) {
    // Zero means "unset", as with every numeric field
    ProxyConfig cfg = load(R"({"datashard": 0, "parityshard": 0})");
    EXPECT_EQ(cfg.transport.kcp.datashard, 10);
    EXPECT_EQ(cfg.transport.kcp.parityshard, 3);
}

TEST(ConfigTest, NegativeValuesFallBackToDefaults) {
    ProxyConfig cfg = load(R"({"conn": -2, "mtu": -1, "keepalive": -10})");
    EXPECT_EQ(cfg.conn, 1);
    EXPECT_EQ(cfg.transport.kcp.mtu, 1350);
    EXPECT_EQ(cfg.transport.mux.keepalive_secs, 10);
}

TEST(ConfigTest, LocalPortUsedWhenLocalAddrMissing) {
    EXPECT_EQ(load(R"({"localport": 7000})").local_addr, "127.0.0.1:7000");
    EXPECT_EQ(load(R"({"localport": 7000, "localaddr": "127.0.0.1:8000"})").local_addr,
              "127.0.0.1:8000");
}

TEST(ConfigTest, NullFieldsCountAsAbsent) {
    ProxyConfig cfg = load(R"({"remoteaddr": null, "conn": null, "mode": null})");
    EXPECT_TRUE(cfg.transport.remote_addr.empty());
    EXPECT_EQ(cfg.conn, 1);
    EXPECT_EQ(cfg.mode, Mode::Fast);
}

TEST(ConfigTest, UnknownFieldsAreIgnored) {
    EXPECT_NO_THROW(load(R"({"crypt": "aes", "nocomp": true})"));
}

TEST(ConfigTest, MalformedJsonIsConfigError) {
    EXPECT_THROW(config::parse("{\"remoteaddr\": "), ConfigError);
    EXPECT_THROW(config::parse(""), ConfigError);
}

TEST(ConfigTest, NonObjectIsConfigError) {
    EXPECT_THROW(config::parse("[1, 2]"), ConfigError);
    EXPECT_THROW(config::parse("\"remote\""), ConfigError);
    EXPECT_THROW(config::parse("null"), ConfigError);
}

TEST(ConfigTest, WrongFieldTypeIsConfigError) {
    EXPECT_THROW(config::parse(R"({"conn": "three"})"), ConfigError);
    EXPECT_THROW(config::parse(R"({"remoteaddr": 42})"), ConfigError);
    EXPECT_THROW(config::parse(R"({"acknodelay": "yes"})"), ConfigError);
}

TEST(ConfigTest, ModePresets) {
    struct Case { const char* name; Mode mode; int nodelay, interval, resend, nc; };
    const Case cases[] = {
        {"normal", Mode::Normal, 0, 40, 2, 1},
        {"fast",   Mode::Fast,   0, 30, 2, 1},
        {"fast2",  Mode::Fast2,  1, 20, 2, 1},
        {"fast3",  Mode::Fast3,  1, 10, 2, 1},
    };
    for (const Case& c : cases) {
        ProxyConfig cfg = load(std::string("{\"mode\": \"") + c.name + "\"}");
        EXPECT_EQ(cfg.mode, c.mode) << c.name;
        EXPECT_EQ(cfg.transport.kcp.nodelay,  c.nodelay)  << c.name;
        EXPECT_EQ(cfg.transport.kcp.interval, c.interval) << c.name;
        EXPECT_EQ(cfg.transport.kcp.resend,   c.resend)   << c.name;
        EXPECT_EQ(cfg.transport.kcp.nc,       c.nc)       << c.name;
        EXPECT_STREQ(config::mode_name(c.mode), c.name);
    }
}

TEST(ConfigTest, UnknownModeFallsBackToFast) {
    EXPECT_EQ(config::parse_mode("turbo"), Mode::Fast);
    EXPECT_EQ(config::parse_mode(""), Mode::Fast);
    EXPECT_EQ(config::parse_mode("FAST2"), Mode::Fast);

    ProxyConfig cfg = load(R"({"mode": "manual"})");
    EXPECT_EQ(cfg.mode, Mode::Fast);
    EXPECT_EQ(cfg.transport.kcp.interval, 30);
}

static std::string validate_message(const std::string& json) {
    ProxyConfig cfg = load(json);
    try {
        config::validate(cfg);
    } catch (const ValidateError& e) {
        return e.what();
    }
    return "";
}

TEST(ConfigValidateTest, AcceptsMinimalConfig) {
    EXPECT_EQ(validate_message(R"({"remoteaddr": "1.2.3.4:29900"})"), "");
}

TEST(ConfigValidateTest, RemoteAddrRequired) {
    EXPECT_EQ(validate_message(R"({"localaddr": "127.0.0.1:0"})"), "remoteaddr is required");
    EXPECT_EQ(validate_message(R"({"remoteaddr": ""})"), "remoteaddr is required");
}

TEST(ConfigValidateTest, ConnMustBePositive) {
    ProxyConfig cfg = load(R"({"remoteaddr": "1.2.3.4:29900"})");
    cfg.conn = 0;
    EXPECT_THROW(config::validate(cfg), ValidateError);
}

TEST(ConfigValidateTest, SmuxVersionAboveTwoRejected) {
    EXPECT_EQ(validate_message(R"({"remoteaddr": "1.2.3.4:29900", "smuxver": 3})"),
              "unsupported smux version: 3");
    EXPECT_EQ(validate_message(R"({"remoteaddr": "1.2.3.4:29900", "smuxver": 2})"), "");
}

TEST(ConfigValidateTest, AddressFormatIsCheckedWhenUsed) {
    // Malformed addresses surface later as Listen or Session errors
    EXPECT_EQ(validate_message(R"({"remoteaddr": "no-port"})"), "");
    EXPECT_EQ(validate_message(R"({"remoteaddr": "host:0"})"), "");
    EXPECT_EQ(validate_message(R"({"remoteaddr": "h:1", "localaddr": "127.0.0.1"})"), "");
    EXPECT_EQ(validate_message(R"({"remoteaddr": "[::1]:29900", "localaddr": ":0"})"), "");
}
