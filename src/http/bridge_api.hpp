#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <bridge/session_supervisor.hpp>
#include "http_server.hpp"

// A validated POST /cli body: either an argument list or one raw line.
struct CliRequest {
    std::vector<std::string> args;
    std::string command;                                 // set when args is empty
    std::optional<std::chrono::milliseconds> timeout;
};

// Validate a /cli body. Err carries the message returned to the client.
Result<CliRequest> parse_cli_request(const std::string& body);

nlohmann::json command_result_json(const CommandResult& r);
nlohmann::json health_json(const BridgeHealth& h);

// HTTP status for a finished command: 400 malformed, 503 not running, else 200.
int command_http_status(const CommandResult& r);

// JSON endpoints over a SessionSupervisor.
class BridgeApi {
public:
    explicit BridgeApi(SessionSupervisor& supervisor) : supervisor_(supervisor) {}

    void register_routes(HttpServer& server);

    HttpResponse handle_health(const HttpRequest& req) const;
    HttpResponse handle_cli(const HttpRequest& req);

private:
    SessionSupervisor& supervisor_;
};
