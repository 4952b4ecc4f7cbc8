#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <vector>
#include <cstdint>

namespace vantage {

// A parsed inbound HTTP request.
struct ApiRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/api/assistant"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct ApiResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Minimal HTTP/1.1 server (one request per connection) for the dashboard's
// backend to call. Meant to sit behind a reverse proxy on a private address.
// A fixed pool of worker threads share the listening socket, so up to
// `workers` requests run concurrently.
class ApiServer {
public:
    using Handler = std::function<ApiResponse(const ApiRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8080"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    ApiServer(std::string listen_addr, uint32_t workers, uint32_t max_body, Handler handler);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Start worker threads. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the workers to stop and join them.
    void stop();

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    workers_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse a raw request head (request line and headers, without the blank line)
// into `req`. Returns false on a malformed request line.
bool parse_request_head(const std::string& headers_raw, ApiRequest& req);

// Read one request from a connected socket. Returns 0 on success, -1 when the
// peer closed or timed out, or the HTTP status to answer with (400, 413, 431).
int read_request(int fd, uint32_t max_body, ApiRequest& req);

} // namespace vantage
