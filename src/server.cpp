#include "server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace vantage {

static constexpr size_t kMaxHeaderBytes = 16384;

// ── Request parsing ───────────────────────────────────────────────────────────

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
            i += 1;
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 3;
        } else {
            out += c;
            i += 1;
        }
    }
    return out;
}

std::string ApiRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string digits = addr.substr(colon + 1);
    if (digits.empty() || digits.size() > 5) return false;
    unsigned long value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool parse_request_head(const std::string& headers_raw, ApiRequest& req) {
    auto line_end = headers_raw.find("\r\n");
    std::istringstream request_line(headers_raw.substr(0, line_end));
    std::string target, version;
    if (!(request_line >> req.method >> target >> version)) return false;

    auto q = target.find('?');
    req.path = target.substr(0, q);
    if (q != std::string::npos) {
        for (const auto& pair : split(target.substr(q + 1), '&')) {
            if (pair.empty()) continue;
            auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            req.query_params[key] = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        }
    }

    if (line_end == std::string::npos) return true;
    for (const auto& line : split(headers_raw.substr(line_end + 2), '\n')) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

int read_request(int fd, uint32_t max_body, ApiRequest& req) {
    std::string buf;
    buf.reserve(4096);
    char chunk[1024];

    size_t head_end = std::string::npos;
    while ((head_end = buf.find("\r\n\r\n")) == std::string::npos) {
        if (buf.size() > kMaxHeaderBytes) return 431;
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return -1;
        buf.append(chunk, static_cast<size_t>(n));
    }

    if (!parse_request_head(buf.substr(0, head_end), req)) return 400;
    if (req.method != "POST") return 0;

    size_t content_length = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_length = std::stoul(it->second);
        } catch (const std::exception&) {
            return 400;
        }
    }
    if (content_length > max_body) return 413;

    req.body = buf.substr(head_end + 4);
    while (req.body.size() < content_length) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return 400;
        req.body.append(chunk, static_cast<size_t>(n));
    }
    if (req.body.size() > content_length) req.body.resize(content_length);
    return 0;
}

// ── Response writing ──────────────────────────────────────────────────────────

static const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

static void write_response(int fd, const ApiResponse& resp) {
    std::ostringstream out;
    out << "HTTP/1.1 " << resp.status << ' ' << status_reason(resp.status) << "\r\n"
        << "Content-Type: " << resp.content_type << "\r\n"
        << "Content-Length: " << resp.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << resp.body;
    std::string wire = out.str();

    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = ::send(fd, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            std::cerr << "[server] send failed: " << std::strerror(errno) << "\n";
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

static ApiResponse plain_error(int status, const std::string& message) {
    return {status, "text/plain", message};
}

// ── ApiServer ─────────────────────────────────────────────────────────────────

ApiServer::ApiServer(std::string listen_addr, uint32_t workers, uint32_t max_body,
                     Handler handler)
    : listen_addr_(std::move(listen_addr))
    , workers_(workers == 0 ? 1 : workers)
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

ApiServer::~ApiServer() {
    stop();
}

static int open_listen_socket(const std::string& host, uint16_t port, std::string& error) {
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        return -1;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    // Workers race for each connection; the losers must not block in accept().
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
    } else if (::listen(fd, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
    } else {
        return fd;
    }
    ::close(fd);
    return -1;
}

bool ApiServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    server_fd_ = open_listen_socket(host, port, error);
    if (server_fd_ < 0) return false;

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_.store(true);
    for (uint32_t i = 0; i < workers_; ++i) {
        threads_.emplace_back([this]() { accept_loop(); });
    }
    std::cerr << "[server] Listening on " << listen_addr_ << " with "
              << workers_ << " workers\n";
    return true;
}

void ApiServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Failed to signal shutdown: " << std::strerror(errno) << "\n";
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    for (int* fd : {&server_fd_, &shutdown_pipe_[0], &shutdown_pipe_[1]}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

void ApiServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        if (::poll(fds, 2, 1000) <= 0) continue;
        if (fds[1].revents & POLLIN) break;  // the byte is never drained, so every worker sees it
        if (!(fds[0].revents & POLLIN)) continue;

        int cfd = ::accept(server_fd_, nullptr, nullptr);
        if (cfd < 0) continue;  // another worker took it

        int cflags = ::fcntl(cfd, F_GETFL, 0);
        ::fcntl(cfd, F_SETFL, cflags & ~O_NONBLOCK);
        struct timeval tv{10, 0};
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        handle_connection(cfd);
        ::close(cfd);
    }
}

void ApiServer::handle_connection(int fd) const {
    ApiRequest req;
    int rc = read_request(fd, max_body_, req);
    if (rc < 0) return;  // peer went away
    if (rc > 0) {
        write_response(fd, plain_error(rc, status_reason(rc)));
        return;
    }

    ApiResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error on " << req.path << ": " << e.what() << "\n";
        resp = {500, "application/json", R"({"error":"internal error"})"};
    }
    write_response(fd, resp);
}

} // namespace vantage
