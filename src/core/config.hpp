#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. Fails if the file is missing or invalid.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (missing keys keep their defaults).
    static Result<Config> parse(const std::string& yaml_text);

    // Load the file if it exists, otherwise defaults; env overrides applied last.
    static Result<Config> load(const fs::path& path = DEFAULT_CONFIG_PATH);

    // MC_SERIAL_PORT, MC_CONFIG_DIR, MC_DEVICE_NAME, MCBRIDGE_PORT, MCBRIDGE_LOG
    void apply_env();

    const BridgeConfig& bridge() const { return bridge_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;
    explicit Config(BridgeConfig bridge) : bridge_(std::move(bridge)) {}

private:
    BridgeConfig bridge_;
    fs::path source_;
};

// Paths derived from a bridge config (shared by Config and the supervisor).
fs::path event_log_path_for(const BridgeConfig& cfg);
fs::path settings_path_for(const BridgeConfig& cfg);

// Program arguments with {serial_port} / {device_name} / {config_dir} filled in.
std::vector<std::string> expand_program_args(const BridgeConfig& cfg);
