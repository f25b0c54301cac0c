#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "horizon.hpp"

namespace {
std::atomic<bool> g_Stop{false};

void HandleSignal(int) {
    g_Stop.store(true);
}
} // namespace

int main(int argc, char **argv) {
    Config config;
    std::string error;
    if (!LoadConfig(argc, argv, config, error)) {
        std::cerr << "Error: " << error << "\n" << Usage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << Usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        Horizon horizon(config);
        horizon.Run(g_Stop);
    } catch (const std::exception &e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}
