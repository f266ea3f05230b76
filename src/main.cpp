#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <memory>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/incident_rag.hpp"
#include "engine/service.hpp"
#include "incidex/errors.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\n[Incidex] Interrupt signal (" << signum << ") received. Shutting down...\n";
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[Incidex] Starting daemon (v0.1.0)...\n";

    std::error_code ec;
    auto config_dir = incidex::platform::system::get_config_dir();
    if (!config_dir.empty()) {
        std::filesystem::create_directories(config_dir, ec);
    }
    auto config_path = argc > 1 ? std::filesystem::path(argv[1]) : config_dir / "config.json";
    std::cout << "[Incidex] Config path: " << config_path << "\n";

    bool first_run = !std::filesystem::exists(config_path);
    auto config = incidex::engine::Config::load(config_path);
    if (first_run) {
        config.save(config_path);
    }

    if (config.data_dir.empty()) {
        config.data_dir = incidex::platform::system::get_data_dir();
        if (config.data_dir.empty()) config.data_dir = std::filesystem::current_path(); // Fallback
    }
    std::cout << "[Incidex] Data dir: " << config.data_dir << "\n";
    std::cout << "[Incidex] Embedding backend: " << config.embedding_backend << "\n";

    if (incidex::platform::system::is_daemon_running(config.socket_name)) {
        std::cerr << "[Incidex] Another daemon is already listening on " << config.socket_name << "\n";
        return 1;
    }

    std::unique_ptr<incidex::engine::IncidentRag> rag;
    try {
        rag = std::make_unique<incidex::engine::IncidentRag>(config);
    } catch (const std::exception& e) {
        std::cerr << "[Incidex] Failed to initialize: " << incidex::describe_nested(e) << "\n";
        return 1;
    }

    incidex::engine::Service service(*rag);
    auto bridge = incidex::platform::Bridge::create();
    if (!bridge || !bridge->listen(config.socket_name)) return 1;

    bridge->set_handler([&service](const std::string& request) {
        return service.handle(request);
    });

    std::cout << "[Incidex] Ready.\n";
    std::thread bridge_thread([&bridge]() { bridge->run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    bridge->stop();
    if (bridge_thread.joinable()) bridge_thread.join();

    return 0;
}
