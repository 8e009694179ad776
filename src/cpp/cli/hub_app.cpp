#include <modelhub/hub_app.h>
#include <modelhub/download_session.h>
#include <modelhub/status_poller.h>
#include <modelhub/utils/path_utils.h>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

#define DEBUG_LOG(app, msg) \
    if ((app)->config_.log_level == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace modelhub {

static const auto POLL_INTERVAL = std::chrono::milliseconds(200);

static std::string resolve_config_dir(const std::string& configured) {
    return configured.empty() ? utils::get_config_dir() : utils::expand_home(configured);
}

HubApp::HubApp(const AppConfig& config, const CommandConfig& command_config,
               const std::atomic<bool>& interrupt)
    : config_(config),
      command_config_(command_config),
      config_dir_(resolve_config_dir(config.config_dir)),
      store_(bundled_catalog_text(),
             (fs::path(config_dir_) / "models_registry.json").string(),
             config.registry_url.empty() ? DEFAULT_REGISTRY_URL : config.registry_url),
      local_config_((fs::path(config_dir_) / "local_models_config.json").string()),
      interrupt_(interrupt) {
}

void HubApp::load_state() {
    DEBUG_LOG(this, "Config directory: " << config_dir_);
    const Catalog& catalog = store_.load();
    local_config_.load(catalog.models);
}

int HubApp::run() {
    const std::string& command = command_config_.command;
    DEBUG_LOG(this, "Running command: " << command);

    if (command == "refresh") {
        return execute_refresh_command();
    }

    load_state();

    if (command == "list") {
        return execute_list_command();
    } else if (command == "search") {
        return execute_search_command();
    } else if (command == "show") {
        return execute_show_command();
    } else if (command == "pull") {
        return execute_pull_command();
    } else if (command == "remove") {
        return execute_remove_command();
    } else if (command == "scan") {
        return execute_scan_command();
    } else if (command == "installed") {
        return execute_installed_command();
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}

ModelState HubApp::local_state(const std::string& id) const {
    const ModelEntry* entry = local_config_.find(id);
    return entry ? entry->status.state : ModelState::NOT_AVAILABLE;
}

void HubApp::print_table(const std::vector<ModelEntry>& models) const {
    std::cout << std::left << std::setw(28) << "Model"
              << std::setw(8) << "Type"
              << std::setw(12) << "Size"
              << "Status" << std::endl;
    std::cout << std::string(70, '-') << std::endl;

    for (const auto& model : models) {
        std::string size = model.storage.size_display.empty()
            ? format_bytes(model.storage.size_bytes) : model.storage.size_display;
        std::cout << std::left << std::setw(28) << model.id
                  << std::setw(8) << category_label(model.category)
                  << std::setw(12) << size
                  << model_state_label(local_state(model.id)) << std::endl;
    }

    std::cout << std::string(70, '-') << std::endl;
}

// Command: list
int HubApp::execute_list_command() {
    if (command_config_.category.empty()) {
        print_table(store_.catalog().models);
    } else {
        print_table(store_.by_category(category_from_string(command_config_.category)));
    }
    return 0;
}

// Command: search
int HubApp::execute_search_command() {
    auto results = store_.search(command_config_.query);
    if (results.empty()) {
        std::cout << "No models match '" << command_config_.query << "'" << std::endl;
        return 1;
    }
    print_table(results);
    return 0;
}

// Command: show
int HubApp::execute_show_command() {
    const std::string& id = command_config_.models.at(0);
    auto entry = store_.get(id);
    if (!entry) {
        std::cerr << "Error: Model not found: " << id << std::endl;
        return 1;
    }

    const ModelEntry* local = local_config_.find(id);

    std::cout << entry->name << " (" << entry->id << ")" << std::endl;
    std::cout << "  " << entry->description << std::endl;
    std::cout << "  Category:  " << category_label(entry->category) << std::endl;
    if (!entry->tags.empty()) {
        std::cout << "  Tags:      ";
        for (size_t i = 0; i < entry->tags.size(); ++i) {
            std::cout << (i ? ", " : "") << entry->tags[i];
        }
        std::cout << std::endl;
    }
    std::cout << "  Source:    " << source_kind_to_string(entry->source.kind);
    if (!entry->source.repo_id.empty()) {
        std::cout << " " << entry->source.repo_id << "@" << entry->source.revision;
    }
    std::cout << std::endl;
    for (const auto& url : entry->source.candidate_urls()) {
        std::cout << "             " << url << std::endl;
    }
    std::cout << "  Path:      " << entry->storage.expanded_path() << std::endl;
    std::cout << "  Size:      " << entry->storage.size_display << std::endl;
    if (entry->runtime.memory_gb > 0) {
        std::cout << "  Memory:    " << entry->runtime.memory_gb << " GB" << std::endl;
    }
    if (!entry->runtime.quantization.empty()) {
        std::cout << "  Quant:     " << entry->runtime.quantization << std::endl;
    }

    if (local) {
        std::cout << "  Status:    " << model_state_label(local->status.state);
        if (local->status.downloaded_bytes > 0) {
            std::cout << " (" << local->status.downloaded_files << " files, "
                      << format_bytes(local->status.downloaded_bytes) << ")";
        }
        std::cout << std::endl;
        if (!local->status.error_message.empty()) {
            std::cout << "  Error:     " << local->status.error_message << std::endl;
        }
    }
    return 0;
}

// Command: pull
int HubApp::execute_pull_command() {
    SessionMap sessions;
    size_t requested = 0;
    size_t succeeded = 0;
    bool any_unknown = false;

    for (const auto& id : command_config_.models) {
        if (sessions.count(id)) {
            continue;
        }
        const ModelEntry* entry = local_config_.find(id);
        if (!entry) {
            std::cerr << "Error: Model not found: " << id << std::endl;
            any_unknown = true;
            continue;
        }

        // Catalog descriptors win; local-only entries download as stored
        std::optional<ModelEntry> catalog_entry = store_.get(id);
        auto session = std::make_unique<DownloadSession>(id);
        local_config_.set_model_state(id, ModelState::DOWNLOADING);
        session->start(catalog_entry ? *catalog_entry : *entry);
        sessions.emplace(id, std::move(session));
        requested++;
    }

    bool cancel_sent = false;
    std::string last_line;

    while (true) {
        if (!cancel_sent && interrupt_.load()) {
            std::cout << "\nCancelling downloads..." << std::endl;
            for (auto& [id, session] : sessions) {
                session->cancel();
            }
            cancel_sent = true;
        }

        TickResult tick = StatusPoller::tick(sessions, &local_config_);

        for (const auto& id : tick.completed) {
            std::cout << "\nModel pulled successfully: " << id << std::endl;
            succeeded++;
        }
        for (const auto& [id, error] : tick.failed) {
            std::cerr << "\nError pulling " << id << ": " << error << std::endl;
        }
        for (const auto& id : tick.cancelled) {
            std::cout << "\nCancelled: " << id << std::endl;
        }

        if (!tick.progress.empty()) {
            std::string line = format_progress_line(tick.progress);
            if (line != last_line) {
                std::cout << "\r  " << line << std::flush;
                last_line = line;
            }
        }

        if (!tick.needs_another_tick) {
            break;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    DEBUG_LOG(this, "Pulled " << succeeded << " of " << requested << " models");
    return (succeeded == requested && !any_unknown) ? 0 : 1;
}

// Command: remove
int HubApp::execute_remove_command() {
    const std::string& id = command_config_.models.at(0);
    if (!local_config_.find(id)) {
        std::cerr << "Error: Model not found: " << id << std::endl;
        return 1;
    }

    if (!local_config_.remove_model_files(id)) {
        std::cerr << "Error: Could not delete all files of " << id << std::endl;
        return 1;
    }
    std::cout << "Model deleted successfully: " << id << std::endl;
    return 0;
}

// Command: scan
int HubApp::execute_scan_command() {
    // load_state() already reconciled every entry; report the result
    for (const auto& model : local_config_.models()) {
        std::cout << std::left << std::setw(28) << model.id
                  << std::setw(16) << model_state_label(model.status.state);
        if (model.status.total_files > 0) {
            std::cout << model.status.downloaded_files << "/" << model.status.total_files << " files, ";
        }
        std::cout << format_bytes(model.status.downloaded_bytes) << std::endl;
    }
    return 0;
}

// Command: refresh
int HubApp::execute_refresh_command() {
    std::cout << "Fetching catalog from " << store_.registry_url() << "..." << std::endl;
    bool written = store_.refresh_async().get();
    if (!written) {
        std::cerr << "Catalog was not updated" << std::endl;
        return 1;
    }
    std::cout << "Catalog override written to " << store_.override_path() << std::endl;
    return 0;
}

// Command: installed
int HubApp::execute_installed_command() {
    size_t count = 0;
    for (const auto& model : local_config_.models()) {
        if (model.status.state == ModelState::NOT_AVAILABLE) {
            continue;
        }
        std::cout << std::left << std::setw(28) << model.id
                  << std::setw(16) << model_state_label(model.status.state)
                  << std::setw(12) << format_bytes(model.status.downloaded_bytes)
                  << model.storage.expanded_path() << std::endl;
        count++;
    }
    if (count == 0) {
        std::cout << "No models installed" << std::endl;
    }
    return 0;
}

} // namespace modelhub
