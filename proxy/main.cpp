// ============================================================
// proxy/main.cpp -- kcpbridge command-line entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "bridge_api.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstring>
#include <csignal>
#include <chrono>
#include <thread>

static volatile std::sig_atomic_t g_stop_requested = 0;

static void sig_handler(int /*sig*/) {
    g_stop_requested = 1;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " -c <config.json> [options]\n"
        << "\n"
        << "  -c FILE        JSON configuration (remoteaddr is required)\n"
        << "\nOptions:\n"
        << "  --verbose      enable debug logging\n"
        << "  --log FILE     also append log lines to FILE\n"
        << "  --version      print version and exit\n"
        << "\nAccepts TCP on localaddr (default 127.0.0.1:1080) and relays every\n"
        << "connection over a pool of KCP sessions to remoteaddr.\n"
        << "\nExample:\n"
        << "  " << prog << " -c client.json --verbose\n";
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    std::string config_path;
    Logger::get().set_level(LogLevel::INFO);

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << bridge::version() << "\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::string json_text;
    if (!read_file(config_path, json_text)) {
        std::cerr << "ERROR: Cannot read config file: " << config_path << "\n";
        return 1;
    }

#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);

    LOG_INFO("kcpbridge " + bridge::version());
    std::string err = bridge::start(json_text);
    if (!err.empty()) {
        std::cerr << "ERROR: " << err << "\n";
        return 2;
    }

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    bridge::stop();
    return 0;
}
