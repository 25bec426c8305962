#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "http_server.hpp"
#include <string>

namespace gptshell {

// Maps control requests onto ExecutionEngine calls and renders JSON bodies.
//
//   POST /run                       {command, stdin?}  -> {stdout, stderr, exit_code}
//   POST /start                     {command, stdin?}  -> {id}
//   GET  /output/{id}[?offset=N]                       -> {stdout, stderr, running, exit_code, ...}
//   POST /kill/{id}                                    -> {message, exit_code}
//   POST /interactive/start         {cmd?}             -> {session_id}
//   GET  /interactive/output/{id}[?offset=N]           -> {output, running, exit_code, next_offset}
//   POST /interactive/input/{id}    {input}            -> {ack}
//   POST /interactive/resize/{id}   {rows, cols}       -> {ack}
//   POST /interactive/kill/{id}                        -> {ack, message, exit_code}
//   GET  /sessions, GET /health, GET /openapi.json
class ControlSurface {
public:
    ControlSurface(ExecutionEngine& engine, ServerConfig config);

    HttpResponse handle(const HttpRequest& req);

private:
    HttpResponse dispatch(const std::string& method, const std::string& path,
                          const HttpRequest& req);

    HttpResponse handle_run(const HttpRequest& req);
    HttpResponse handle_start(const HttpRequest& req);
    HttpResponse handle_output(const std::string& id, const HttpRequest& req);
    HttpResponse handle_kill(const std::string& id);
    HttpResponse handle_interactive_start(const HttpRequest& req);
    HttpResponse handle_interactive_output(const std::string& id, const HttpRequest& req);
    HttpResponse handle_interactive_input(const std::string& id, const HttpRequest& req);
    HttpResponse handle_interactive_resize(const std::string& id, const HttpRequest& req);
    HttpResponse handle_interactive_kill(const std::string& id);
    HttpResponse handle_sessions();
    HttpResponse handle_openapi() const;

    ExecutionEngine& engine_;
    ServerConfig config_;
};

// Remove base_path from the front of path when present ("" leaves it as is).
std::string strip_base_path(const std::string& path, const std::string& base_path);

// HTTP status for an engine error kind.
int http_status_for(ErrorKind kind);

} // namespace gptshell
