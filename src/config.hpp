#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace gptshell {

struct ServerConfig {
    std::string listen = "127.0.0.1:8000";
    uint32_t max_body = 1048576;
    std::string base_path;     // stripped from request paths, e.g. "/gpt-shell"
    std::string openapi_path;  // file served at GET /openapi.json
};

struct ExecConfig {
    std::string shell = "/bin/sh";   // runs `shell -c command`
    std::string interactive_shell;   // empty = $SHELL, then /bin/sh
    std::string term = "dumb";
    uint16_t pty_rows = 24;
    uint16_t pty_cols = 80;
    uint32_t kill_grace_ms = 2000;
    uint32_t max_buffer_bytes = 1048576;  // per buffer, 0 = unbounded
    uint32_t session_ttl = 3600;          // seconds a finished record is kept, 0 = forever
    bool echo_output = true;              // log every output chunk to stderr
};

struct Config {
    ServerConfig server;
    ExecConfig exec;
    bool auto_approve = false;  // skip the Y/n confirmation gate

    // Load from ~/.gptshell/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if absent) + env vars
    static Config load(const std::string& path);

    // Parse an already-merged JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();
};

// exec.interactive_shell, else $SHELL if absolute, else /bin/sh
std::string resolve_interactive_shell(const ExecConfig& exec);

// Recursively add keys present in defaults but missing from existing.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

constexpr const char* kDefaultConfigPath = "~/.gptshell/config.json";

} // namespace gptshell
