#include "config.hpp"
#include "errors.hpp"
#include "server_app.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }
}  // namespace

int main(int argc, char** argv) {
    hazard::AppConfig cfg;
    try {
        cfg = hazard::parse_args(argc, argv);
    } catch (const hazard::PipelineError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[INFO] Starting hazard-node control server\n";
    hazard::ServerApp app(cfg);
    app.start();
    std::cout << "[INFO] Press Ctrl+C to exit\n";

    while (!g_stop && app.listening()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    app.stop();
    std::cout << "[INFO] Server stopped\n";
    return 0;
}
