#include <iostream>
#include <csignal>
#include <atomic>
#include <modelhub/cli_parser.h>
#include <modelhub/hub_app.h>

using namespace modelhub;

// Global flag for signal handling
static std::atomic<bool> g_interrupt_requested(false);

// Signal handler for Ctrl+C and SIGTERM. Only raises the flag: the pull loop
// cancels its sessions on the next tick and lets the workers clean up.
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupt_requested = true;
    }
}

int main(int argc, char** argv) {
    try {
        CLIParser parser;

        parser.parse(argc, argv);

        // Check if we should continue (false for --help, --version, or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        HubApp app(parser.get_config(), parser.get_command_config(), g_interrupt_requested);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
