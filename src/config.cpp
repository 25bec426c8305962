#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace gptshell {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:8000"},
            {"max_body", 1048576},
            {"base_path", ""},
            {"openapi_path", ""}
        }},
        {"exec", {
            {"shell", "/bin/sh"},
            {"interactive_shell", ""},
            {"term", "dumb"},
            {"pty_rows", 24},
            {"pty_cols", 80},
            {"kill_grace_ms", 2000},
            {"max_buffer_bytes", 1048576},
            {"session_ttl", 3600},
            {"echo_output", true}
        }},
        {"auto_approve", false}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("max_body") && s["max_body"].is_number_unsigned())
            cfg.server.max_body = s["max_body"].get<uint32_t>();
        if (s.contains("base_path") && s["base_path"].is_string())
            cfg.server.base_path = s["base_path"].get<std::string>();
        if (s.contains("openapi_path") && s["openapi_path"].is_string())
            cfg.server.openapi_path = s["openapi_path"].get<std::string>();
    }

    if (j.contains("exec") && j["exec"].is_object()) {
        auto& e = j["exec"];
        if (e.contains("shell") && e["shell"].is_string())
            cfg.exec.shell = e["shell"].get<std::string>();
        if (e.contains("interactive_shell") && e["interactive_shell"].is_string())
            cfg.exec.interactive_shell = e["interactive_shell"].get<std::string>();
        if (e.contains("term") && e["term"].is_string())
            cfg.exec.term = e["term"].get<std::string>();
        if (e.contains("pty_rows") && e["pty_rows"].is_number_unsigned())
            cfg.exec.pty_rows = e["pty_rows"].get<uint16_t>();
        if (e.contains("pty_cols") && e["pty_cols"].is_number_unsigned())
            cfg.exec.pty_cols = e["pty_cols"].get<uint16_t>();
        if (e.contains("kill_grace_ms") && e["kill_grace_ms"].is_number_unsigned())
            cfg.exec.kill_grace_ms = e["kill_grace_ms"].get<uint32_t>();
        if (e.contains("max_buffer_bytes") && e["max_buffer_bytes"].is_number_unsigned())
            cfg.exec.max_buffer_bytes = e["max_buffer_bytes"].get<uint32_t>();
        if (e.contains("session_ttl") && e["session_ttl"].is_number_unsigned())
            cfg.exec.session_ttl = e["session_ttl"].get<uint32_t>();
        if (e.contains("echo_output") && e["echo_output"].is_boolean())
            cfg.exec.echo_output = e["echo_output"].get<bool>();
    }

    if (j.contains("auto_approve") && j["auto_approve"].is_boolean())
        cfg.auto_approve = j["auto_approve"].get<bool>();

    return cfg;
}

Config Config::load() {
    return load(expand_home(kDefaultConfigPath));
}

Config Config::load(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("GPTSHELL_LISTEN"))
        cfg.server.listen = v;
    if (const char* v = std::getenv("GPTSHELL_SHELL"))
        cfg.exec.shell = v;
    if (const char* v = std::getenv("GPTSHELL_AUTO_APPROVE")) {
        std::string s = to_lower(v);
        cfg.auto_approve = (s == "1" || s == "true" || s == "yes");
    }

    return cfg;
}

std::string resolve_interactive_shell(const ExecConfig& exec) {
    if (!exec.interactive_shell.empty()) return exec.interactive_shell;
    if (const char* sh = std::getenv("SHELL")) {
        if (*sh == '/') return sh;
    }
    return "/bin/sh";
}

} // namespace gptshell
