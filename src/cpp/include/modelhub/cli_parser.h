#pragma once

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace modelhub {

struct AppConfig {
    std::string log_level = "info";
    std::string config_dir = "";    // empty = ~/.modelhub
    std::string registry_url;        // remote catalog, defaults to DEFAULT_REGISTRY_URL
};

struct CommandConfig {
    std::string command;             // No default - must be explicitly specified
    std::vector<std::string> models;
    std::string query;
    std::string category = "";       // list filter, empty = all
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    AppConfig get_config() const { return config_; }
    CommandConfig get_command_config() const { return command_config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

private:
    CLI::App app_;
    AppConfig config_;
    CommandConfig command_config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace modelhub
