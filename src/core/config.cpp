#include "config.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>

namespace fs = std::filesystem;

static std::vector<std::string> parse_string_list(const YAML::Node& node,
                                                  const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    // Accept a single scalar as a one-element list
    if (node.IsScalar()) return {node.as<std::string>()};
    if (!node.IsSequence()) return fallback;

    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

static void parse_http_config(const YAML::Node& node, HttpConfig& http) {
    if (!node || !node.IsMap()) return;
    http.host = node["host"].as<std::string>(http.host);
    http.port = node["port"].as<int>(http.port);
}

static void parse_timeout_config(const YAML::Node& node, TimeoutConfig& t) {
    if (!node || !node.IsMap()) return;
    t.default_secs = node["default_secs"].as<int>(t.default_secs);
    t.recv_secs = node["recv_secs"].as<int>(t.recv_secs);
}

static BridgeConfig parse_bridge_config(const YAML::Node& root) {
    BridgeConfig cfg;
    if (!root || !root.IsMap()) return cfg;

    cfg.serial_port = root["serial_port"].as<std::string>(cfg.serial_port);
    cfg.config_dir = root["config_dir"].as<std::string>(cfg.config_dir);
    cfg.device_name = root["device_name"].as<std::string>(cfg.device_name);
    cfg.program = root["program"].as<std::string>(cfg.program);
    cfg.program_args = parse_string_list(root["program_args"], cfg.program_args);

    parse_http_config(root["http"], cfg.http);
    parse_timeout_config(root["timeouts"], cfg.timeouts);

    cfg.quiescence_ms = root["quiescence_ms"].as<int>(cfg.quiescence_ms);
    cfg.health_check_secs = root["health_check_secs"].as<int>(cfg.health_check_secs);
    cfg.restart_backoff_secs = root["restart_backoff_secs"].as<int>(cfg.restart_backoff_secs);
    cfg.shutdown_grace_ms = root["shutdown_grace_ms"].as<int>(cfg.shutdown_grace_ms);
    cfg.init_settle_ms = root["init_settle_ms"].as<int>(cfg.init_settle_ms);

    cfg.event_types = parse_string_list(root["event_types"], cfg.event_types);
    cfg.init_commands = parse_string_list(root["init_commands"], cfg.init_commands);

    if (root["toggle_commands"] && root["toggle_commands"].IsMap()) {
        cfg.toggle_commands.clear();
        for (const auto& kv : root["toggle_commands"]) {
            cfg.toggle_commands[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }

    cfg.log_file = root["log_file"].as<std::string>(cfg.log_file);
    cfg.log_debug = root["log_debug"].as<bool>(cfg.log_debug);
    return cfg;
}

static Result<void> validate(const BridgeConfig& cfg) {
    if (cfg.program.empty())
        return Result<void>::Err("program must not be empty");
    if (cfg.quiescence_ms <= 0)
        return Result<void>::Err("quiescence_ms must be positive");
    if (cfg.health_check_secs <= 0)
        return Result<void>::Err("health_check_secs must be positive");
    if (cfg.http.port <= 0 || cfg.http.port > 65535)
        return Result<void>::Err(fmt::format("invalid http.port {}", cfg.http.port));
    if (cfg.timeouts.default_secs <= 0 || cfg.timeouts.recv_secs <= 0)
        return Result<void>::Err("timeouts must be positive");
    if (cfg.timeouts.default_secs > MAX_CMD_TIMEOUT_SECS || cfg.timeouts.recv_secs > MAX_CMD_TIMEOUT_SECS)
        return Result<void>::Err(fmt::format("timeouts must not exceed {} seconds", MAX_CMD_TIMEOUT_SECS));
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config(parse_bridge_config(root));
        auto check = validate(config.bridge_);
        if (check.is_err()) return Result<Config>::Err(check.error);
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid config: {}", e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config file not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config(parse_bridge_config(root));
        config.source_ = path;
        auto check = validate(config.bridge_);
        if (check.is_err()) {
            return Result<Config>::Err(fmt::format("{}: {}", path.string(), check.error));
        }
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    Config config;
    if (!path.empty() && fs::exists(path)) {
        auto loaded = load_file(path);
        if (loaded.is_err()) return loaded;
        config = loaded.value;
    }
    config.apply_env();

    auto check = validate(config.bridge_);
    if (check.is_err()) return Result<Config>::Err(check.error);
    return Result<Config>::Ok(config);
}

void Config::apply_env() {
    if (const char* v = std::getenv("MC_SERIAL_PORT"); v && *v) bridge_.serial_port = v;
    if (const char* v = std::getenv("MC_CONFIG_DIR"); v && *v) bridge_.config_dir = v;
    if (const char* v = std::getenv("MC_DEVICE_NAME"); v && *v) bridge_.device_name = v;
    if (const char* v = std::getenv("MCBRIDGE_PORT"); v && *v)
        bridge_.http.port = safe_stoi(v, bridge_.http.port);
    if (const char* v = std::getenv("MCBRIDGE_LOG"); v && *v) bridge_.log_file = v;
}

fs::path event_log_path_for(const BridgeConfig& cfg) {
    return fs::path(cfg.config_dir) / (cfg.device_name + EVENT_LOG_SUFFIX);
}

fs::path settings_path_for(const BridgeConfig& cfg) {
    return fs::path(cfg.config_dir) / SETTINGS_FILE_NAME;
}

std::vector<std::string> expand_program_args(const BridgeConfig& cfg) {
    std::vector<std::string> out;
    out.reserve(cfg.program_args.size());
    for (const auto& arg : cfg.program_args) {
        std::string a = substitute(arg, "serial_port", cfg.serial_port);
        a = substitute(a, "device_name", cfg.device_name);
        a = substitute(a, "config_dir", cfg.config_dir);
        out.push_back(a);
    }
    return out;
}
