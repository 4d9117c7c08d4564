#include "settings.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

Result<SessionSettings> parse_session_settings(const std::string& json_text) {
    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return Result<SessionSettings>::Err("settings file is not valid JSON");
    }
    if (!root.is_object()) {
        return Result<SessionSettings>::Err("settings file must contain a JSON object");
    }

    SessionSettings settings;
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (it.value().is_boolean()) {
            settings.toggles[it.key()] = it.value().get<bool>();
        }
    }
    return Result<SessionSettings>::Ok(settings);
}

Result<SessionSettings> load_session_settings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<SessionSettings>::Ok(SessionSettings{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<SessionSettings>::Err("cannot read " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto parsed = parse_session_settings(ss.str());
    if (parsed.is_err()) {
        return Result<SessionSettings>::Err(fmt::format("{}: {}", path.string(), parsed.error));
    }
    return parsed;
}

std::vector<std::string> build_init_commands(const BridgeConfig& cfg,
                                             const SessionSettings& settings) {
    std::vector<std::string> cmds = cfg.init_commands;
    for (const auto& [toggle, cmd] : cfg.toggle_commands) {
        if (settings.enabled(toggle)) cmds.push_back(cmd);
    }
    return cmds;
}
