#include <modelhub/cli_parser.h>
#include <modelhub/catalog_store.h>
#include <modelhub/version.h>

#define APP_NAME "modelhub"
#define APP_DESC APP_NAME " - Model catalog and downloader"

#define PULL_FOOTER "Examples:\n" \
    "  # Pull one model from the catalog\n" \
    "  modelhub pull qwen3-8b\n\n" \
    "  # Pull several models at once (Ctrl+C cancels all of them)\n" \
    "  modelhub pull flux-klein-4b funasr-paraformer"

namespace modelhub {

CLIParser::CLIParser()
    : app_(APP_DESC) {

    config_.registry_url = DEFAULT_REGISTRY_URL;

    app_.set_version_flag("-v,--version", (APP_NAME " version " MODELHUB_VERSION_STRING));
    app_.require_subcommand(1);
    app_.set_help_all_flag("--help-all", "Print help for all commands");

    app_.add_option("--log-level", config_.log_level, "Log level")
        ->envname("MODELHUB_LOG_LEVEL")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"error", "warning", "info", "debug"}))
        ->default_val(config_.log_level);

    app_.add_option("--config-dir", config_.config_dir,
                    "Directory holding the catalog override and the installed-models config (default: ~/.modelhub)")
        ->envname("MODELHUB_CONFIG_DIR")
        ->type_name("PATH");

    app_.add_option("--registry-url", config_.registry_url, "URL of the remote model catalog")
        ->envname("MODELHUB_REGISTRY_URL")
        ->type_name("URL")
        ->default_val(config_.registry_url);

    // List
    CLI::App* list = app_.add_subcommand("list", "List catalog models with their local status");
    list->add_option("--category", command_config_.category, "Only show one category")
        ->type_name("CATEGORY")
        ->check(CLI::IsMember({"llm", "vlm", "asr", "tts", "image_gen"}));

    // Search
    CLI::App* search = app_.add_subcommand("search", "Search names, descriptions and tags");
    search->add_option("query", command_config_.query, "Case-insensitive search text")->required();

    // Show
    CLI::App* show = app_.add_subcommand("show", "Show details of a model");
    show->add_option("model", command_config_.models, "The model to show")
        ->type_name("MODEL")
        ->required()
        ->expected(1);

    // Pull
    CLI::App* pull = app_.add_subcommand("pull", "Download one or more models");
    pull->add_option("models", command_config_.models, "The models to download")
        ->type_name("MODEL")
        ->required();
    pull->footer(PULL_FOOTER);

    // Remove
    CLI::App* remove = app_.add_subcommand("remove", "Delete the files of a model");
    remove->add_option("model", command_config_.models, "The model to delete")
        ->type_name("MODEL")
        ->required()
        ->expected(1);

    // Scan
    app_.add_subcommand("scan", "Reconcile installed models with the disk");

    // Refresh
    app_.add_subcommand("refresh", "Fetch the remote catalog into the local override");

    // Installed
    app_.add_subcommand("installed", "List models present on disk");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        // Show help if no arguments provided
        if (argc == 1) {
            throw CLI::CallForHelp();
        }
        app_.parse(argc, argv);

        command_config_.command = app_.get_subcommands().at(0)->get_name();
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace modelhub
