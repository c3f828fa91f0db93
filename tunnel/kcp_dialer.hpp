#pragma once

// ============================================================
// kcp_dialer.hpp -- SessionFactory that dials KCP over UDP and
//   runs a mux client session on top
// ============================================================

#include "../common/platform.hpp"
#include "../common/transport.hpp"
#include <memory>

class KcpSessionFactory : public SessionFactory {
public:
    std::shared_ptr<TransportSession> create(const TransportOptions& opts) override;

private:
    platform::Guard platform_guard_;
};
