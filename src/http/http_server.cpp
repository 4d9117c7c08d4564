#include "http_server.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ── Request / response ─────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? "" : it->second;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& body) {
    HttpResponse r;
    r.status = status;
    r.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return r;
}

const char* http_reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string HttpResponse::serialize() const {
    return fmt::format("HTTP/1.1 {} {}\r\n"
                       "Content-Type: {}\r\n"
                       "Content-Length: {}\r\n"
                       "Connection: close\r\n"
                       "\r\n"
                       "{}",
                       status, http_reason_phrase(status), content_type, body.size(), body);
}

size_t complete_request_size(const std::string& raw) {
    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos) return 0;
    size_t head = end + 4;

    // Content-Length only; chunked bodies are rejected by the parser
    size_t length = 0;
    std::string lower = lowercase(raw.substr(0, end));
    auto pos = lower.find("\r\ncontent-length:");
    if (pos != std::string::npos) {
        auto value = lower.substr(pos + 17, lower.find("\r\n", pos + 2) - (pos + 17));
        trim(value);
        int n = safe_stoi(value, -1);
        if (n < 0) return head;     // let the parser report it
        length = static_cast<size_t>(n);
    }
    return raw.size() >= head + length ? head + length : 0;
}

Result<HttpRequest> parse_http_request(const std::string& raw) {
    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos) {
        return Result<HttpRequest>::Err("incomplete request head");
    }

    HttpRequest req;
    auto line_end = raw.find("\r\n");
    std::string request_line = raw.substr(0, line_end);

    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
        return Result<HttpRequest>::Err("malformed request line");
    }
    req.method = request_line.substr(0, sp1);
    req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = request_line.substr(sp2 + 1);
    if (req.method.empty() || req.target.empty() || req.version.rfind("HTTP/1.", 0) != 0) {
        return Result<HttpRequest>::Err("malformed request line");
    }
    req.path = req.target.substr(0, req.target.find('?'));

    size_t pos = line_end + 2;
    while (pos < end) {
        auto eol = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, eol - pos);
        pos = eol + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Result<HttpRequest>::Err(fmt::format("malformed header: {}", line));
        }
        std::string value = line.substr(colon + 1);
        trim(value);
        req.headers[lowercase(line.substr(0, colon))] = value;
    }

    if (!req.header("transfer-encoding").empty()) {
        return Result<HttpRequest>::Err("transfer-encoding not supported");
    }

    size_t length = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        int n = safe_stoi(cl, -1);
        if (n < 0) return Result<HttpRequest>::Err("invalid Content-Length");
        length = static_cast<size_t>(n);
    }
    if (raw.size() < end + 4 + length) {
        return Result<HttpRequest>::Err("body shorter than Content-Length");
    }
    req.body = raw.substr(end + 4, length);
    return Result<HttpRequest>::Ok(std::move(req));
}

// ── HttpServer ─────────────────────────────────────────────────

HttpServer::HttpServer(std::string host, int port)
    : host_(std::move(host)), port_(port) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    routes_[path][method] = std::move(handler);
}

Result<void> HttpServer::start() {
    if (running_) return Result<void>::Ok();

    auto sock = platform::listen_tcp(host_, port_, HTTP_LISTEN_BACKLOG);
    if (sock.is_err()) return Result<void>::Err(sock.error);

    listen_fd_ = sock.value;
    bound_port_ = platform::bound_port(listen_fd_);
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    bridge_log(fmt::format("HTTP: listening on {}:{}", host_, bound_port_));
    return Result<void>::Ok();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    if (accept_thread_.joinable()) accept_thread_.join();
    reap_connections(true);
    platform::close_socket(listen_fd_);
    listen_fd_ = MCB_INVALID_SOCKET;
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    auto by_path = routes_.find(req.path);
    if (by_path == routes_.end()) {
        return HttpResponse::json(404, {{"error", "not found"}});
    }
    auto by_method = by_path->second.find(req.method);
    if (by_method == by_path->second.end()) {
        return HttpResponse::json(405, {{"error", "method not allowed"}});
    }

    try {
        return by_method->second(req);
    } catch (const std::exception& e) {
        bridge_log_error(fmt::format("HTTP: {} {} handler failed: {}", req.method, req.path, e.what()));
        return HttpResponse::json(500, {
            {"success", false}, {"stdout", ""}, {"stderr", e.what()}, {"returncode", -1}});
    }
}

void HttpServer::reap_connections(bool all) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (all || (*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::accept_loop() {
    while (running_) {
        // Accept with timeout so we can check the stop flag
        int ev = platform::poll_socket(listen_fd_, POLLIN, HTTP_ACCEPT_POLL_MS);
        reap_connections(false);
        if (ev <= 0) continue;

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        socket_t client = accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                                 &len, SOCK_CLOEXEC);
        if (client < 0) continue;

        auto conn = std::make_unique<Connection>();
        auto* raw = conn.get();
        std::lock_guard<std::mutex> lock(conn_mutex_);
        conn->thread = std::thread(&HttpServer::serve_connection, this, client, raw);
        connections_.push_back(std::move(conn));
    }
}

void HttpServer::serve_connection(socket_t client, Connection* conn) {
    std::string raw;
    char buf[HTTP_READ_BUF_SIZE];
    HttpResponse resp;
    bool have_response = false;

    while (running_) {
        size_t size = complete_request_size(raw);
        if (size > 0) break;
        if (raw.size() > HTTP_MAX_REQUEST_BYTES) {
            resp = HttpResponse::json(413, {{"error", "request too large"}});
            have_response = true;
            break;
        }

        int ev = platform::poll_socket(client, POLLIN, HTTP_READ_TIMEOUT_MS);
        if (ev <= 0) {
            resp = HttpResponse::json(408, {{"error", "request timeout"}});
            have_response = true;
            break;
        }
        ssize_t n = recv(client, buf, sizeof(buf), 0);
        if (n <= 0) break;      // peer closed
        raw.append(buf, static_cast<size_t>(n));
    }

    if (!have_response && complete_request_size(raw) > 0) {
        auto req = parse_http_request(raw);
        if (req.is_err()) {
            resp = HttpResponse::json(400, {{"error", req.error}});
        } else {
            resp = dispatch(req.value);
            bridge_log_debug(fmt::format("HTTP: {} {} -> {}", req.value.method,
                                         req.value.path, resp.status));
        }
        have_response = true;
    }

    if (have_response && !platform::send_all(client, resp.serialize())) {
        bridge_log_debug("HTTP: client went away before the response was sent");
    }
    platform::close_socket(client);
    conn->done = true;
}
