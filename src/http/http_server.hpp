#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

struct HttpRequest {
    std::string method;
    std::string target;     // as sent, including any query string
    std::string path;       // target without the query string
    std::string version;
    std::map<std::string, std::string> headers;   // names lowercased
    std::string body;

    // Header value, "" if absent. name is case-insensitive.
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    static HttpResponse json(int status, const nlohmann::json& body);

    // Full HTTP/1.1 message, always with Connection: close.
    std::string serialize() const;
};

const char* http_reason_phrase(int status);

// Size of the first complete request in raw (headers plus Content-Length
// body), or 0 if more bytes are needed.
size_t complete_request_size(const std::string& raw);

// Parse one complete request (request line, headers, body).
Result<HttpRequest> parse_http_request(const std::string& raw);

// Minimal HTTP/1.1 server: one request per connection, one thread per
// connection, routes matched on exact method and path.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpServer(std::string host, int port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(const std::string& method, const std::string& path, Handler handler);

    // Bind, listen and start accepting.
    Result<void> start();
    void stop();

    bool is_running() const { return running_; }

    // Port actually bound (differs from the configured one when it was 0).
    int port() const { return bound_port_; }

    // Route a parsed request (404 / 405 when nothing matches).
    HttpResponse dispatch(const HttpRequest& req) const;

private:
    std::string host_;
    int port_;
    int bound_port_ = 0;
    socket_t listen_fd_ = MCB_INVALID_SOCKET;

    std::map<std::string, std::map<std::string, Handler>> routes_;   // path -> method -> handler

    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
    };
    std::vector<std::unique_ptr<Connection>> connections_;
    std::mutex conn_mutex_;

    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    void accept_loop();
    void serve_connection(socket_t client, Connection* conn);
    void reap_connections(bool all);
};
