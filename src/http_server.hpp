#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace gptshell {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/output/<id>", query string removed
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Minimal HTTP/1.1 server for the control API. One connection per request
// (Connection: close). The accept loop runs on a background thread and each
// accepted connection is handled on its own thread, so a long /run does not
// hold up other controllers.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8000"; port 0 picks a free port
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, join the accept thread and wait for in-flight handlers.
    void stop();

    // Port actually bound (valid after start()).
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    size_t active_workers_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Decode %XX escapes and '+' as space.
std::string url_decode(const std::string& s);

} // namespace gptshell
