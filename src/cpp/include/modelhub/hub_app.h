#pragma once

#include <atomic>
#include <string>
#include "catalog_store.h"
#include "cli_parser.h"
#include "local_models_config.h"

namespace modelhub {

// Runs one CLI subcommand against the catalog and the installed-models config
class HubApp {
public:
    // interrupt is raised by the signal handler; pull cancels every session
    // once it is set
    HubApp(const AppConfig& config, const CommandConfig& command_config,
           const std::atomic<bool>& interrupt);

    int run();

private:
    void load_state();

    int execute_list_command();
    int execute_search_command();
    int execute_show_command();
    int execute_pull_command();
    int execute_remove_command();
    int execute_scan_command();
    int execute_refresh_command();
    int execute_installed_command();

    void print_table(const std::vector<ModelEntry>& models) const;
    ModelState local_state(const std::string& id) const;

    AppConfig config_;
    CommandConfig command_config_;
    std::string config_dir_;
    CatalogStore store_;
    LocalModelsConfig local_config_;
    const std::atomic<bool>& interrupt_;
};

} // namespace modelhub
