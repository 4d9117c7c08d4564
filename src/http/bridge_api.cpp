#include "bridge_api.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

static HttpResponse cli_error(int status, const std::string& reason, const char* error) {
    return HttpResponse::json(status, {
        {"success", false},
        {"stdout", ""},
        {"stderr", reason},
        {"returncode", -1},
        {"error", error},
    });
}

// ── Request validation ─────────────────────────────────────────

Result<CliRequest> parse_cli_request(const std::string& body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return Result<CliRequest>::Err("Request body must be a JSON object");
    }

    CliRequest req;
    auto args = data.find("args");
    auto command = data.find("command");

    if (args != data.end()) {
        if (!args->is_array()) {
            return Result<CliRequest>::Err("args must be a list");
        }
        if (args->empty()) {
            return Result<CliRequest>::Err("args must not be empty");
        }
        for (const auto& a : *args) {
            if (!a.is_string()) return Result<CliRequest>::Err("args must be a list of strings");
            req.args.push_back(a.get<std::string>());
        }
    } else if (command != data.end()) {
        if (!command->is_string()) {
            return Result<CliRequest>::Err("command must be a string");
        }
        req.command = command->get<std::string>();
    } else {
        return Result<CliRequest>::Err("Missing required field: args");
    }

    auto timeout = data.find("timeout");
    if (timeout != data.end() && !timeout->is_null()) {
        if (!timeout->is_number() || timeout->get<double>() <= 0) {
            return Result<CliRequest>::Err("timeout must be a positive number of seconds");
        }
        double secs = timeout->get<double>();
        if (!(secs <= MAX_CMD_TIMEOUT_SECS)) {
            return Result<CliRequest>::Err(
                fmt::format("timeout must not exceed {} seconds", MAX_CMD_TIMEOUT_SECS));
        }
        req.timeout = std::chrono::milliseconds(static_cast<int64_t>(secs * 1000));
    }
    return Result<CliRequest>::Ok(std::move(req));
}

// ── Serialization ──────────────────────────────────────────────

json command_result_json(const CommandResult& r) {
    json j = {
        {"success", r.success},
        {"stdout", r.stdout_data},
        {"stderr", r.stderr_data},
        {"returncode", r.returncode()},
    };
    j["error"] = r.success ? json(nullptr) : json(command_error_name(r.error));
    return j;
}

json health_json(const BridgeHealth& h) {
    return {
        {"status", h.healthy ? "healthy" : "unhealthy"},
        {"state", session_state_name(h.state)},
        {"serial_port", h.serial_port},
        {"device_name", h.device_name},
        {"advert_log", h.advert_log},
        {"pid", h.pid > 0 ? json(h.pid) : json(nullptr)},
        {"restarts", h.restarts},
        {"session_started", h.session_started.empty() ? json(nullptr) : json(h.session_started)},
        {"pending_commands", h.pending_commands},
        {"in_flight", h.in_flight.empty() ? json(nullptr) : json(h.in_flight)},
    };
}

int command_http_status(const CommandResult& r) {
    switch (r.error) {
        case CommandError::Malformed:  return 400;
        case CommandError::NotRunning:
        case CommandError::Shutdown:   return 503;
        default:                       return 200;
    }
}

// ── Handlers ───────────────────────────────────────────────────

void BridgeApi::register_routes(HttpServer& server) {
    server.route("GET", "/health", [this](const HttpRequest& req) { return handle_health(req); });
    server.route("POST", "/cli", [this](const HttpRequest& req) { return handle_cli(req); });
}

HttpResponse BridgeApi::handle_health(const HttpRequest&) const {
    return HttpResponse::json(200, health_json(supervisor_.health()));
}

HttpResponse BridgeApi::handle_cli(const HttpRequest& req) {
    auto parsed = parse_cli_request(req.body);
    if (parsed.is_err()) {
        return cli_error(400, parsed.error, "invalid_request");
    }

    const CliRequest& cli = parsed.value;
    CommandResult result;
    if (!cli.args.empty()) {
        result = supervisor_.execute(cli.args, cli.timeout);
    } else {
        std::string verb = cli.command.substr(0, cli.command.find(' '));
        auto timeout = cli.timeout.value_or(supervisor_.default_timeout({verb}));
        result = supervisor_.execute_line(cli.command, timeout);
    }

    return HttpResponse::json(command_http_status(result), command_result_json(result));
}
