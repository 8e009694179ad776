#include <catch2/catch.hpp>

#include <modelhub/local_models_config.h>
#include <modelhub/utils/json_utils.h>
#include "test_helpers.h"

using namespace modelhub;
using modelhub::test::TempDir;
using modelhub::test::make_entry;
using modelhub::test::write_file;

namespace fs = std::filesystem;

namespace {

std::vector<ModelEntry> default_models(const fs::path& root) {
    return {
        make_entry("alpha", SourceKind::HUGGING_FACE, "https://h/org/alpha", root / "alpha"),
        make_entry("beta", SourceKind::DIRECT_URL, "https://h/files/beta.bin", root / "beta")
    };
}

} // namespace

TEST_CASE("First load writes a config with every default model") {
    TempDir tmp;
    auto path = tmp.path() / "config" / "local_models_config.json";

    LocalModelsConfig config(path.string());
    config.load(default_models(tmp.path()));

    REQUIRE(config.models().size() == 2);
    REQUIRE(fs::exists(path));

    json doc = utils::JsonUtils::load_from_file(path.string());
    REQUIRE(doc["version"] == LOCAL_CONFIG_VERSION);
    REQUIRE(doc["models"].size() == 2);
    REQUIRE(doc["models"][0]["status"]["state"] == "not_available");
    REQUIRE_FALSE(doc["last_updated"].get<std::string>().empty());
}

TEST_CASE("Startup scan replaces a stale downloading state") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";
    auto defaults = default_models(tmp.path());

    {
        LocalModelsConfig config(path.string());
        config.load(defaults);
        REQUIRE(config.set_model_state("alpha", ModelState::DOWNLOADING));
        REQUIRE(config.set_model_state("beta", ModelState::DOWNLOADING));
    }
    write_file(tmp.path() / "beta" / "beta.bin", std::string(128, 'b'));

    LocalModelsConfig reloaded(path.string());
    reloaded.load(defaults);

    REQUIRE(reloaded.find("alpha")->status.state == ModelState::NOT_AVAILABLE);
    REQUIRE(reloaded.find("beta")->status.state == ModelState::READY);
    REQUIRE(reloaded.find("beta")->status.downloaded_bytes == 128);
}

TEST_CASE("Malformed config falls back to defaults") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";
    write_file(path, "{\"models\": [");

    LocalModelsConfig config(path.string());
    config.load(default_models(tmp.path()));

    REQUIRE(config.models().size() == 2);
    json doc = utils::JsonUtils::load_from_file(path.string());
    REQUIRE(doc["models"].size() == 2);
}

TEST_CASE("Entries missing from the defaults are kept and new defaults appended") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";

    auto custom = make_entry("custom", SourceKind::DIRECT_URL, "https://h/files/c.bin", tmp.path() / "custom");
    json doc = {
        {"version", LOCAL_CONFIG_VERSION},
        {"models", json::array({model_entry_to_json(custom, true)})}
    };
    utils::JsonUtils::save_to_file(doc, path.string());

    LocalModelsConfig config(path.string());
    config.load(default_models(tmp.path()));

    REQUIRE(config.models().size() == 3);
    REQUIRE(config.models()[0].id == "custom");
    REQUIRE(config.find("alpha"));
    REQUIRE(config.find("beta"));
}

TEST_CASE("Catalog changes reach entries already in the config") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";
    auto defaults = default_models(tmp.path());

    {
        LocalModelsConfig config(path.string());
        config.load(defaults);
        write_file(tmp.path() / "alpha" / "model.bin", std::string(32, 'a'));
        config.mark_ready("alpha");
    }

    defaults[0].source.backup_urls = {"https://mirror/org/alpha"};
    defaults[0].source.revision = "v2";
    defaults[0].name = "Alpha Renamed";

    LocalModelsConfig reloaded(path.string());
    reloaded.load(defaults);

    const ModelEntry* alpha = reloaded.find("alpha");
    REQUIRE(alpha->name == "Alpha Renamed");
    REQUIRE(alpha->source.backup_urls == std::vector<std::string>{"https://mirror/org/alpha"});
    REQUIRE(alpha->source.revision == "v2");
    REQUIRE(alpha->status.state == ModelState::READY);
    REQUIRE_FALSE(alpha->status.last_downloaded.empty());

    json doc = utils::JsonUtils::load_from_file(path.string());
    REQUIRE(doc["models"][0]["source"]["backup_urls"][0] == "https://mirror/org/alpha");
}

TEST_CASE("Unreadable config location falls back to defaults") {
    TempDir tmp;
    // A self-referencing link makes every lookup below it fail with ELOOP
    auto loop = tmp.path() / "loop";
    fs::create_symlink(loop, loop);

    LocalModelsConfig config((loop / "local_models_config.json").string());
    REQUIRE_NOTHROW(config.load(default_models(tmp.path())));
    REQUIRE(config.models().size() == 2);
}

TEST_CASE("Sink callbacks persist terminal outcomes") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";
    LocalModelsConfig config(path.string());
    config.load(default_models(tmp.path()));

    SECTION("completed download becomes ready") {
        write_file(tmp.path() / "alpha" / "model.bin", std::string(256, 'a'));
        write_file(tmp.path() / "alpha" / "config.json", "{}");
        config.on_completed("alpha");

        const ModelEntry* alpha = config.find("alpha");
        REQUIRE(alpha->status.state == ModelState::READY);
        REQUIRE(alpha->status.downloaded_files == 2);
        REQUIRE(alpha->status.downloaded_bytes == 258);
        REQUIRE_FALSE(alpha->status.last_downloaded.empty());
    }

    SECTION("failed download keeps the error message") {
        config.on_failed("alpha", "HTTP 503");

        json doc = utils::JsonUtils::load_from_file(path.string());
        REQUIRE(doc["models"][0]["status"]["state"] == "error");
        REQUIRE(doc["models"][0]["status"]["error_message"] == "HTTP 503");
    }

    SECTION("cancelled download is rescanned") {
        config.set_model_state("beta", ModelState::DOWNLOADING);
        config.on_cancelled("beta");
        REQUIRE(config.find("beta")->status.state == ModelState::NOT_AVAILABLE);
    }

    SECTION("unknown ids are ignored") {
        config.on_completed("nope");
        config.on_failed("nope", "x");
        REQUIRE_FALSE(config.set_model_state("nope", ModelState::READY));
        REQUIRE(config.models().size() == 2);
    }
}

TEST_CASE("File-list entries are reconciled file by file when marked ready") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";

    auto sovits = make_entry("sovits", SourceKind::MANUAL, "", tmp.path() / "sovits");
    sovits.files = {{"s1.ckpt", 100, false}, {"s2.pth", 100, false}};
    LocalModelsConfig config(path.string());
    config.load({sovits});

    write_file(tmp.path() / "sovits" / "s1.ckpt", std::string(100, 'x'));
    config.mark_ready("sovits");
    REQUIRE(config.find("sovits")->status.state == ModelState::PARTIAL);

    write_file(tmp.path() / "sovits" / "s2.pth", std::string(100, 'x'));
    config.mark_ready("sovits");
    REQUIRE(config.find("sovits")->status.state == ModelState::READY);
    REQUIRE(config.find("sovits")->files[1].downloaded);
}

TEST_CASE("Removing model files resets the entry") {
    TempDir tmp;
    auto path = tmp.path() / "local_models_config.json";
    write_file(tmp.path() / "alpha" / "weights" / "model.bin", std::string(64, 'a'));

    LocalModelsConfig config(path.string());
    config.load(default_models(tmp.path()));
    REQUIRE(config.find("alpha")->status.state == ModelState::READY);

    REQUIRE(config.remove_model_files("alpha"));
    REQUIRE_FALSE(fs::exists(tmp.path() / "alpha"));
    REQUIRE(config.find("alpha")->status.state == ModelState::NOT_AVAILABLE);
    REQUIRE(config.find("alpha")->status.downloaded_bytes == 0);

    REQUIRE_FALSE(config.remove_model_files("nope"));
}
