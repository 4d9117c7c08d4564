#pragma once

#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

// Toggles persisted by the web application in .webui_settings.json.
// The bridge only reads them, once per session start.
struct SessionSettings {
    std::map<std::string, bool> toggles;

    bool enabled(const std::string& name) const {
        auto it = toggles.find(name);
        return it != toggles.end() && it->second;
    }
};

// Missing file → empty settings. Non-boolean values are ignored.
Result<SessionSettings> load_session_settings(const std::filesystem::path& path);

// Parse the settings JSON text.
Result<SessionSettings> parse_session_settings(const std::string& json_text);

// Fixed init commands followed by the command of every enabled toggle.
std::vector<std::string> build_init_commands(const BridgeConfig& cfg,
                                             const SessionSettings& settings);
