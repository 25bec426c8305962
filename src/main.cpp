#include "config.hpp"
#include "approval.hpp"
#include "executor.hpp"
#include "http_server.hpp"
#include "routes.hpp"
#include "session_table.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: gpt-shell [options]\n"
              << "\n"
              << "Local command-execution agent controlled over HTTP.\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default: 127.0.0.1:8000)\n"
              << "  -y, --yes            Run commands without the Y/n confirmation prompt\n"
              << "  --config PATH        Config file (default: ~/.gptshell/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  POST /run                      Run a command to completion\n"
              << "  POST /start                    Start a detached command\n"
              << "  GET  /output/{id}              Poll new output of a detached command\n"
              << "  POST /kill/{id}                Terminate a detached command\n"
              << "  POST /interactive/start        Start a PTY session\n"
              << "  GET  /interactive/output/{id}  Poll new PTY output\n"
              << "  POST /interactive/input/{id}   Write to a PTY session\n"
              << "  POST /interactive/resize/{id}  Set the PTY window size\n"
              << "  POST /interactive/kill/{id}    Terminate a PTY session\n"
              << "  GET  /sessions                 List known sessions\n"
              << "\n"
              << "Environment variables:\n"
              << "  GPTSHELL_LISTEN        Listen address\n"
              << "  GPTSHELL_SHELL         Shell used for `-c` commands (default: /bin/sh)\n"
              << "  GPTSHELL_AUTO_APPROVE  Set to 1 to skip the confirmation prompt\n";
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string config_path = gptshell::kDefaultConfigPath;
    bool yes = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-y") == 0 || std::strcmp(argv[i], "--yes") == 0) {
            yes = true;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = gptshell::Config::load(gptshell::expand_home(config_path));

    // Override config with CLI args
    if (!listen.empty()) config.server.listen = listen;
    if (yes) config.auto_approve = true;

    gptshell::CommandApprover approver;
    if (config.auto_approve) {
        std::cerr << "[server] confirmation prompt disabled, commands run unattended\n";
    } else {
        approver = gptshell::make_console_approver(std::cin, std::cout);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    gptshell::SessionTable table;
    gptshell::ExecutionEngine engine(table, config.exec, approver);
    gptshell::ControlSurface surface(engine, config.server);

    gptshell::HttpServer server(config.server.listen, config.server.max_body,
        [&surface](const gptshell::HttpRequest& req) {
            return surface.handle(req);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        return 1;
    }
    std::cerr << "[server] listening on " << config.server.listen;
    if (!config.server.base_path.empty()) std::cerr << " under " << config.server.base_path;
    std::cerr << "\n";

    // Main loop: wait for a signal, purge finished sessions about once a minute
    uint32_t tick = 0;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (++tick % 300 == 0) {
            engine.purge_finished();
        }
    }

    std::cerr << "[server] shutting down\n";
    engine.shutdown();
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
