#pragma once

// ============================================================
// config.hpp -- Proxy configuration: JSON parsing, defaults,
//   mode presets and validation
//
// Start() runs the phases separately so each failure can be
// reported with its own prefix:
//   parse()          -> ConfigError   ("Config Error: ...")
//   apply_defaults()
//   apply_mode()
//   validate()       -> ValidateError ("Validate Error: ...")
// ============================================================

#include "../common/platform.hpp"
#include "../common/transport.hpp"
#include <string>
#include <stdexcept>

// Malformed JSON or a field of the wrong type
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Well-formed config that cannot be run
class ValidateError : public std::runtime_error {
public:
    explicit ValidateError(const std::string& msg) : std::runtime_error(msg) {}
};

// KCP tuning presets
enum class Mode {
    Normal,
    Fast,
    Fast2,
    Fast3,
};

struct ModeParams {
    int nodelay;
    int interval;   // ms
    int resend;
    int nc;         // 1 = congestion control off
};

struct ProxyConfig {
    std::string      local_addr;        // "host:port"; port 0 = ephemeral
    int              local_port{0};     // used when local_addr is empty
    std::string      mode_name;         // as given (after defaulting)
    Mode             mode{Mode::Fast};
    int              conn{0};           // session pool size
    TransportOptions transport;         // remote address + KCP + mux tuning
};

namespace config {

static constexpr const char* DEFAULT_LOCAL_HOST = "127.0.0.1";
static constexpr int         DEFAULT_LOCAL_PORT = 1080;
static constexpr int         MAX_SMUX_VERSION   = 2;

// Unknown names map to Mode::Fast
Mode        parse_mode(const std::string& name);
const char* mode_name(Mode mode);
ModeParams  mode_params(Mode mode);

// Read the JSON document; absent or null fields stay zero/empty.
ProxyConfig parse(const std::string& json_text);

// Fill every unset (zero, negative or empty) field with its default
void apply_defaults(ProxyConfig& cfg);

// Copy the mode preset into the KCP options
void apply_mode(ProxyConfig& cfg);

void validate(const ProxyConfig& cfg);

} // namespace config
