#include "routes.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace gptshell {

namespace {

using json = nlohmann::json;

// Malformed request: answered with the given status, never reaches the engine.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& kind, const std::string& detail)
        : std::runtime_error(detail), status_(status), kind_(kind) {}

    int status() const { return status_; }
    const std::string& kind() const { return kind_; }

private:
    int status_;
    std::string kind_;
};

HttpResponse json_response(int status, const json& body) {
    HttpResponse resp;
    resp.status = status;
    resp.body = body.dump();
    return resp;
}

HttpResponse error_response(int status, const std::string& kind, const std::string& detail) {
    return json_response(status, json{{"error", kind}, {"detail", detail}});
}

HttpResponse method_not_allowed(const std::string& method, const std::string& path) {
    return error_response(405, "method_not_allowed", method + " " + path);
}

json exit_code_json(const std::optional<int>& code) {
    return code ? json(*code) : json(nullptr);
}

// Matches "<prefix><id>" where id is a single non-empty path segment.
bool match_id(const std::string& path, const std::string& prefix, std::string& id) {
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0)
        return false;
    std::string rest = path.substr(prefix.size());
    if (rest.find('/') != std::string::npos) return false;
    id = url_decode(rest);
    return !id.empty();
}

json parse_body(const HttpRequest& req, bool allow_empty) {
    if (trim(req.body).empty()) {
        if (allow_empty) return json::object();
        throw RequestError(400, "bad_request", "Request body is required");
    }
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error& e) {
        throw RequestError(400, "bad_request", std::string("Malformed JSON: ") + e.what());
    }
    if (!body.is_object())
        throw RequestError(400, "bad_request", "Request body must be a JSON object");
    return body;
}

std::optional<std::string> optional_string(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_string())
        throw RequestError(400, "bad_request", std::string("Field '") + field + "' must be a string");
    return it->get<std::string>();
}

std::string required_string(const json& body, const char* field) {
    auto value = optional_string(body, field);
    if (!value)
        throw RequestError(400, "bad_request", std::string("Missing required field '") + field + "'");
    return *value;
}

std::string required_command(const json& body, const char* field) {
    std::string command = required_string(body, field);
    if (trim(command).empty())
        throw RequestError(400, "bad_request", std::string("Field '") + field + "' is empty");
    return command;
}

uint16_t required_dimension(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_number_integer())
        throw RequestError(400, "bad_request", std::string("Field '") + field + "' must be an integer");
    auto v = it->get<int64_t>();
    if (v < 1 || v > 65535)
        throw RequestError(400, "bad_request", std::string("Field '") + field + "' is out of range");
    return static_cast<uint16_t>(v);
}

// Returns the numeric query parameter, or nullopt when absent.
std::optional<uint64_t> offset_param(const HttpRequest& req, const char* key) {
    auto it = req.query_params.find(key);
    if (it == req.query_params.end()) return std::nullopt;
    const std::string& s = it->second;
    if (s.empty() || s.size() > 20 || s.find_first_not_of("0123456789") != std::string::npos)
        throw RequestError(400, "bad_request", std::string("Invalid '") + key + "' parameter");
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        throw RequestError(400, "bad_request", std::string("Invalid '") + key + "' parameter");
    }
}

} // anonymous namespace

// ── Free helpers ─────────────────────────────────────────────────────────────

std::string strip_base_path(const std::string& path, const std::string& base_path) {
    std::string base = base_path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (base.empty()) return path;
    if (path.compare(0, base.size(), base) != 0) return path;
    if (path.size() == base.size()) return "/";
    if (path[base.size()] != '/') return path;
    return path.substr(base.size());
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:      return 404;
        case ErrorKind::SessionClosed: return 409;
        case ErrorKind::Rejected:      return 403;
        case ErrorKind::ExecFailure:   return 500;
        case ErrorKind::Internal:      return 500;
    }
    return 500;
}

// ── ControlSurface ───────────────────────────────────────────────────────────

ControlSurface::ControlSurface(ExecutionEngine& engine, ServerConfig config)
    : engine_(engine), config_(std::move(config)) {}

HttpResponse ControlSurface::handle(const HttpRequest& req) {
    std::string path = strip_base_path(req.path, config_.base_path);
    try {
        return dispatch(req.method, path, req);
    } catch (const RequestError& e) {
        return error_response(e.status(), e.kind(), e.what());
    } catch (const AgentError& e) {
        if (e.kind() == ErrorKind::Internal) {
            std::cerr << "[server] " << req.method << " " << path << ": " << e.what() << "\n";
        }
        return error_response(http_status_for(e.kind()), error_kind_name(e.kind()), e.what());
    }
}

HttpResponse ControlSurface::dispatch(const std::string& method, const std::string& path,
                                      const HttpRequest& req) {
    bool get = method == "GET";
    bool post = method == "POST";
    std::string id;

    if (path == "/run")
        return post ? handle_run(req) : method_not_allowed(method, path);
    if (path == "/start")
        return post ? handle_start(req) : method_not_allowed(method, path);
    if (match_id(path, "/output/", id))
        return get ? handle_output(id, req) : method_not_allowed(method, path);
    if (match_id(path, "/kill/", id))
        return post ? handle_kill(id) : method_not_allowed(method, path);

    if (path == "/interactive/start")
        return post ? handle_interactive_start(req) : method_not_allowed(method, path);
    if (match_id(path, "/interactive/output/", id))
        return get ? handle_interactive_output(id, req) : method_not_allowed(method, path);
    if (match_id(path, "/interactive/input/", id))
        return post ? handle_interactive_input(id, req) : method_not_allowed(method, path);
    if (match_id(path, "/interactive/resize/", id))
        return post ? handle_interactive_resize(id, req) : method_not_allowed(method, path);
    if (match_id(path, "/interactive/kill/", id))
        return post ? handle_interactive_kill(id) : method_not_allowed(method, path);

    if (path == "/sessions")
        return get ? handle_sessions() : method_not_allowed(method, path);
    if (path == "/health")
        return get ? json_response(200, json{{"status", "ok"}}) : method_not_allowed(method, path);
    if (path == "/openapi.json")
        return get ? handle_openapi() : method_not_allowed(method, path);

    return error_response(404, "not_found", "No route for " + method + " " + path);
}

// ── Detached / blocking ──────────────────────────────────────────────────────

HttpResponse ControlSurface::handle_run(const HttpRequest& req) {
    json body = parse_body(req, false);
    std::string command = required_command(body, "command");
    auto stdin_data = optional_string(body, "stdin");

    RunResult result;
    try {
        result = engine_.run_blocking(command, stdin_data);
    } catch (const AgentError& e) {
        if (e.kind() != ErrorKind::ExecFailure) throw;
        // Spawn failures are reported in-band as a failed run.
        result.stdout_data.clear();
        result.stderr_data = e.what();
        result.exit_code = -1;
    }
    return json_response(200, json{
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
    });
}

HttpResponse ControlSurface::handle_start(const HttpRequest& req) {
    json body = parse_body(req, false);
    std::string command = required_command(body, "command");
    auto stdin_data = optional_string(body, "stdin");
    std::string id = engine_.start_detached(command, stdin_data);
    return json_response(200, json{{"id", id}});
}

HttpResponse ControlSurface::handle_output(const std::string& id, const HttpRequest& req) {
    auto both = offset_param(req, "offset");
    auto out_off = offset_param(req, "stdout_offset");
    auto err_off = offset_param(req, "stderr_offset");

    OutputDelta delta;
    if (both || out_off || err_off) {
        uint64_t so = out_off ? *out_off : both.value_or(0);
        uint64_t eo = err_off ? *err_off : both.value_or(0);
        delta = engine_.get_output_from(id, so, eo);
    } else {
        delta = engine_.get_output(id);
    }

    return json_response(200, json{
        {"stdout", delta.stdout_data},
        {"stderr", delta.stderr_data},
        {"running", delta.running},
        {"exit_code", exit_code_json(delta.exit_code)},
        {"stdout_next_offset", delta.stdout_next_offset},
        {"stderr_next_offset", delta.stderr_next_offset},
    });
}

HttpResponse ControlSurface::handle_kill(const std::string& id) {
    KillResult result = engine_.kill(id);
    return json_response(200, json{
        {"message", result.message},
        {"exit_code", exit_code_json(result.exit_code)},
    });
}

// ── Interactive ──────────────────────────────────────────────────────────────

HttpResponse ControlSurface::handle_interactive_start(const HttpRequest& req) {
    json body = parse_body(req, true);
    std::string cmd = optional_string(body, "cmd").value_or("");
    std::string id = engine_.interactive_start(cmd);
    return json_response(200, json{{"session_id", id}});
}

HttpResponse ControlSurface::handle_interactive_output(const std::string& id,
                                                       const HttpRequest& req) {
    auto offset = offset_param(req, "offset");
    InteractiveDelta delta = offset ? engine_.interactive_output_from(id, *offset)
                                    : engine_.interactive_output(id);
    return json_response(200, json{
        {"output", delta.output},
        {"running", delta.running},
        {"exit_code", exit_code_json(delta.exit_code)},
        {"next_offset", delta.next_offset},
    });
}

HttpResponse ControlSurface::handle_interactive_input(const std::string& id,
                                                      const HttpRequest& req) {
    json body = parse_body(req, false);
    std::string input = required_string(body, "input");
    engine_.interactive_input(id, input);
    return json_response(200, json{{"ack", true}});
}

HttpResponse ControlSurface::handle_interactive_resize(const std::string& id,
                                                       const HttpRequest& req) {
    json body = parse_body(req, false);
    uint16_t rows = required_dimension(body, "rows");
    uint16_t cols = required_dimension(body, "cols");
    engine_.interactive_resize(id, rows, cols);
    return json_response(200, json{{"ack", true}});
}

HttpResponse ControlSurface::handle_interactive_kill(const std::string& id) {
    KillResult result = engine_.interactive_kill(id);
    return json_response(200, json{
        {"ack", true},
        {"message", result.message},
        {"exit_code", exit_code_json(result.exit_code)},
    });
}

// ── Misc ─────────────────────────────────────────────────────────────────────

HttpResponse ControlSurface::handle_sessions() {
    json list = json::array();
    for (const auto& s : engine_.list_sessions()) {
        list.push_back(json{
            {"id", s.id},
            {"mode", mode_name(s.mode)},
            {"status", status_name(s.status)},
            {"exit_code", exit_code_json(s.exit_code)},
            {"command", s.command},
            {"created_at", s.created_at},
        });
    }
    return json_response(200, json{{"sessions", list}});
}

HttpResponse ControlSurface::handle_openapi() const {
    if (config_.openapi_path.empty())
        return error_response(404, "not_found", "No OpenAPI document configured");
    std::string doc;
    if (!read_file(expand_home(config_.openapi_path), doc)) {
        std::cerr << "[server] cannot read " << config_.openapi_path << "\n";
        return error_response(404, "not_found", "OpenAPI document unavailable");
    }
    HttpResponse resp;
    resp.body = std::move(doc);
    return resp;
}

} // namespace gptshell
