// ============================================================
// bridge_api.cpp
// ============================================================

#include "bridge_api.hpp"
#include "../tunnel/kcp_dialer.hpp"

namespace bridge {

ProxyApp& default_app() {
    static ProxyApp app(std::make_shared<KcpSessionFactory>());
    return app;
}

std::string start(const std::string& config_json) {
    return default_app().start(config_json);
}

void stop() {
    default_app().stop();
}

bool is_running() {
    return default_app().is_running();
}

std::string version() {
    return KCPBRIDGE_VERSION;
}

} // namespace bridge
