#pragma once

// ============================================================
// bridge_api.hpp -- Flat host-facing API over one process-wide
//   ProxyApp that dials KCP sessions
//
// Hosts that need several proxies, or their own transport,
// construct ProxyApp directly instead.
// ============================================================

#include "proxy_app.hpp"
#include <string>

#ifndef KCPBRIDGE_VERSION
#define KCPBRIDGE_VERSION "MOBILE-1.0"
#endif

namespace bridge {

// "" on success, otherwise a phase-prefixed error string
std::string start(const std::string& config_json);

// Idempotent
void stop();

bool is_running();

std::string version();

// The instance behind the functions above
ProxyApp& default_app();

} // namespace bridge
