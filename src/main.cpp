#include <iostream>
#include <string>
#include <csignal>
#include <pthread.h>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <bridge/session_supervisor.hpp>
#include <http/bridge_api.hpp>
#include <http/http_server.hpp>
#include <platform/platform.hpp>

void print_usage() {
    std::cout << "mcbridge " << MCBRIDGE_VERSION
              << " - HTTP bridge to a persistent meshcli session\n\n"
              << "Usage\n"
              << "    mcbridge [--config PATH] [serve]   Run the bridge until SIGINT/SIGTERM\n"
              << "    mcbridge --version                 Show version\n"
              << "    mcbridge --help                    Show this help\n\n"
              << "Environment\n"
              << "    MC_SERIAL_PORT, MC_CONFIG_DIR, MC_DEVICE_NAME, MCBRIDGE_PORT, MCBRIDGE_LOG\n";
}

static int serve(const std::string& config_path, bool explicit_config) {
    Result<Config> loaded = explicit_config ? Config::load_file(config_path)
                                            : Config::load(config_path);
    if (loaded.is_ok() && explicit_config) loaded.value.apply_env();
    if (loaded.is_err()) {
        std::cerr << "mcbridge: " << loaded.error << "\n";
        return 1;
    }
    const BridgeConfig& cfg = loaded.value.bridge();

    set_bridge_log_path(cfg.log_file);
    set_bridge_log_debug(cfg.log_debug);
    platform::ignore_sigpipe();

    // Block termination signals in every thread; main waits for them below
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    bridge_log(fmt::format("mcbridge {} starting (config: {})", MCBRIDGE_VERSION,
        loaded.value.source().empty() ? "defaults" : loaded.value.source().string()));

    SessionSupervisor supervisor(cfg);
    auto started = supervisor.start();
    if (started.is_err()) {
        bridge_log_error(started.error);
    }

    HttpServer server(cfg.http.host, cfg.http.port);
    BridgeApi api(supervisor);
    api.register_routes(server);
    auto listening = server.start();
    if (listening.is_err()) {
        bridge_log_error(fmt::format("HTTP: {}", listening.error));
        supervisor.shutdown();
        return 1;
    }

    int sig = 0;
    sigwait(&signals, &sig);
    bridge_log(fmt::format("received signal {}, stopping", sig));

    // Supervisor first: failing pending commands releases blocked handlers
    supervisor.shutdown();
    server.stop();
    bridge_log("mcbridge stopped");
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "mcbridge version " << MCBRIDGE_VERSION << "\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "mcbridge: --config needs a path\n";
                return 1;
            }
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg == "serve") {
            // default command
        } else {
            std::cerr << "mcbridge: unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    try {
        return serve(config_path, explicit_config);
    } catch (const std::exception& e) {
        std::cerr << "mcbridge: " << e.what() << "\n";
        return 1;
    }
}
