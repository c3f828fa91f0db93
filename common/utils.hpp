#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <random>

namespace utils {

// Monotonic milliseconds, truncated to 32 bits (KCP clock)
inline u32 clock32_ms() {
    using namespace std::chrono;
    return (u32)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Split "host:port" (or "[v6]:port") into its parts.
// An empty host is allowed (":1080" means all interfaces).
// Returns false if the string has no port or the port is not numeric/in range.
inline bool split_host_port(const std::string& addr, std::string& host, int& port) {
    std::string h, p;
    if (!addr.empty() && addr.front() == '[') {
        size_t close = addr.find(']');
        if (close == std::string::npos || close + 1 >= addr.size() || addr[close + 1] != ':')
            return false;
        h = addr.substr(1, close - 1);
        p = addr.substr(close + 2);
    } else {
        size_t colon = addr.rfind(':');
        if (colon == std::string::npos) return false;
        h = addr.substr(0, colon);
        if (h.find(':') != std::string::npos) return false; // bare IPv6 needs brackets
        p = addr.substr(colon + 1);
    }
    if (p.empty() || p.size() > 5) return false;
    for (char c : p) {
        if (c < '0' || c > '9') return false;
    }
    int v = std::atoi(p.c_str());
    if (v < 0 || v > 65535) return false;
    host = h;
    port = v;
    return true;
}

inline std::string join_host_port(const std::string& host, int port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// Random 32-bit value (KCP conversation ids)
inline u32 random_u32() {
    static thread_local std::mt19937 gen(std::random_device{}());
    return std::uniform_int_distribution<u32>()(gen);
}

} // namespace utils
