// kasa-runtime: connects the configured and discovered devices and polls them

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

struct CliOptions {
    std::string config_path = "kasa-runtime.yaml";
    std::optional<std::string> log_level;
    bool once = false;
};

void print_usage() {
    std::cerr << "Usage: kasa-runtime [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config=PATH       YAML config (default: kasa-runtime.yaml)\n"
              << "  --log-level=LEVEL   debug|info|warn|error, overrides logging.level\n"
              << "  --once              refresh every device once and exit\n"
              << "  --help, -h          show this help\n";
}

// Returns -1 to continue, otherwise the exit code
int parse_args(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--once") {
            options.once = true;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            options.config_path = arg.substr(9);
        } else if (arg.rfind("--log-level=", 0) == 0) {
            options.log_level = arg.substr(12);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }
    return -1;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    int exit_code = parse_args(argc, argv, options);
    if (exit_code >= 0) {
        return exit_code;
    }

    // Logger is not configured yet
    if (!std::filesystem::exists(options.config_path)) {
        std::cerr << "ERROR: Config file not found: " << options.config_path << "\n";
        return 1;
    }

    kasa::runtime::RuntimeConfig config;
    std::string error;
    if (!kasa::runtime::load_config(options.config_path, config, error)) {
        LOG_ERROR("Failed to load " << options.config_path << ": " << error);
        return 1;
    }
    if (options.log_level) {
        config.logging.level = *options.log_level;
    }
    kasa::logging::Logger::set_level(kasa::logging::string_to_level(config.logging.level));

    // Installed before initialize so a signal during discovery is honored
    kasa::runtime::SignalHandler::install();

    kasa::runtime::Runtime runtime(config);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    if (options.once) {
        size_t failures = runtime.poll_once();
        runtime.drain_events();
        runtime.shutdown();
        return failures == 0 ? 0 : 2;
    }

    runtime.run();
    runtime.shutdown();
    LOG_INFO("kasa-runtime stopped");
    return 0;
}
