#include <catch2/catch.hpp>

#include <modelhub/download_session.h>
#include <modelhub/filesystem_reconciler.h>
#include <stdexcept>
#include "fake_hub_server.h"
#include "test_helpers.h"

using namespace modelhub;
using modelhub::test::EnvVarGuard;
using modelhub::test::FakeHubServer;
using modelhub::test::TempDir;
using modelhub::test::make_entry;
using modelhub::test::wait_until;

namespace fs = std::filesystem;

namespace {

// Keeps the developer's own token out of the requests
struct IsolatedHome {
    TempDir home;
    EnvVarGuard home_guard{"HOME", home.path().string()};
    EnvVarGuard token_guard{"HF_TOKEN", std::nullopt};
};

} // namespace

TEST_CASE("Snapshot fraction and progress text") {
    SessionSnapshot snap;
    REQUIRE(snap.fraction() == 0.0);

    snap.bytes_total = 300 * 1048576ull;
    snap.bytes_transferred = 126 * 1048576ull;
    snap.current_file = "model-00002-of-00004.safetensors";
    REQUIRE(snap.fraction() == Approx(0.42));
    REQUIRE(snap.progress_text() == "42.0%  (126/300 MB)  model-00002-of-00004.safetensors");

    snap.bytes_transferred = snap.bytes_total * 2;
    REQUIRE(snap.fraction() == 1.0);
}

TEST_CASE("Manual source fails synchronously") {
    TempDir tmp;
    auto entry = make_entry("sovits", SourceKind::MANUAL, "", tmp.path() / "sovits");

    DownloadSession session("sovits");
    session.start(entry);

    REQUIRE_FALSE(session.is_active());
    REQUIRE(session.is_failed());
    REQUIRE(session.error_message() == MANUAL_INSTALL_MESSAGE);
    REQUIRE_FALSE(fs::exists(tmp.path() / "sovits"));
}

TEST_CASE("Session refuses a different model") {
    TempDir tmp;
    DownloadSession session("alpha");
    auto entry = make_entry("beta", SourceKind::MANUAL, "", tmp.path() / "beta");
    REQUIRE_THROWS_AS(session.start(entry), std::logic_error);
}

TEST_CASE("Tree source downloads every listed file") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "config.json", "{\"layers\": 2}");
    server.add_file("org/model", "weights/model.safetensors", std::string(200000, 'w'));
    TempDir tmp;
    auto storage = tmp.path() / "models" / "alpha";

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), storage));
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE_FALSE(session.is_failed());
    REQUIRE_FALSE(session.is_active());
    REQUIRE(session.bytes_total() == 200000 + 13);
    REQUIRE(session.bytes_transferred() == session.bytes_total());
    REQUIRE(modelhub::test::read_file(storage / "config.json") == "{\"layers\": 2}");
    REQUIRE(fs::file_size(storage / "weights" / "model.safetensors") == 200000);

    auto snap = session.snapshot();
    REQUIRE(snap.total_files == 2);
    REQUIRE(snap.fraction() == 1.0);
}

TEST_CASE("Direct URL source falls back to the backup mirror") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_direct_file("ggml-base.bin", std::string(5000, 'g'));
    TempDir tmp;
    auto storage = tmp.path() / "whisper";

    auto entry = make_entry("whisper", SourceKind::DIRECT_URL, server.direct_url("gone/ggml-base.bin"), storage);
    entry.source.backup_urls = {server.direct_url("ggml-base.bin")};

    DownloadSession session("whisper");
    session.start(entry);
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE(session.error_message().empty());
    REQUIRE(fs::file_size(storage / "ggml-base.bin") == 5000);
}

TEST_CASE("Tree source falls back when the primary repository is empty") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("mirror/model", "model.bin", "weights");
    TempDir tmp;
    auto storage = tmp.path() / "alpha";

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("origin/model"), storage);
    entry.source.backup_urls = {server.hf_url("mirror/model")};

    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE(modelhub::test::read_file(storage / "model.bin") == "weights");
}

TEST_CASE("Unreachable primary host falls back without failing the session") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "model.bin", "weights");
    TempDir tmp;
    auto storage = tmp.path() / "alpha";

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, "http://127.0.0.1:1/org/model", storage);
    entry.source.backup_urls = {server.hf_url("org/model")};

    DownloadSession session("alpha");
    session.start(entry);

    bool failed_early = false;
    while (session.is_active()) {
        failed_early = failed_early || session.is_failed();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    session.join();

    REQUIRE_FALSE(failed_early);
    REQUIRE(session.is_completed());
    REQUIRE_FALSE(session.is_failed());
}

TEST_CASE("All candidates failing reports the last error and cleans up") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "config.json", "{}");
    server.add_file("org/model", "model.bin", std::string(1000, 'x'));
    server.fail_file("model.bin");
    TempDir tmp;
    auto storage = tmp.path() / "alpha";

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), storage);
    entry.source.backup_urls = {server.hf_url("org/absent")};

    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE_FALSE(session.is_completed());
    REQUIRE_FALSE(session.is_cancelled());
    REQUIRE(session.error_message().find("org/absent") != std::string::npos);
    REQUIRE_FALSE(fs::exists(storage));
}

TEST_CASE("Failure keeps a storage directory that already existed") {
    IsolatedHome isolated;
    FakeHubServer server;
    TempDir tmp;
    auto storage = tmp.path() / "alpha";
    modelhub::test::write_file(storage / "notes.txt", "mine");

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/absent"), storage));
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE(modelhub::test::read_file(storage / "notes.txt") == "mine");
}

TEST_CASE("Failure into an empty existing directory leaves nothing that looks downloaded") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "config.json", "{}");
    server.add_file("org/model", "model.bin", std::string(1000, 'x'));
    server.fail_file("model.bin");
    TempDir tmp;
    auto storage = tmp.path() / "alpha";
    fs::create_directories(storage);

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), storage);
    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE_FALSE(fs::exists(storage / "config.json"));

    FilesystemReconciler::reconcile(entry);
    REQUIRE(entry.status.state == ModelState::NOT_AVAILABLE);
}

TEST_CASE("Files from a failed mirror do not survive the backup") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/primary", "extra.json", "{}");
    server.add_file("org/primary", "weights/extra.bin", std::string(300, 'e'));
    server.add_file("org/primary", "weights/zz.bin", std::string(300, 'z'));
    server.fail_file("weights/zz.bin");
    server.add_file("org/backup", "model.bin", "weights");
    TempDir tmp;
    auto storage = tmp.path() / "alpha";
    modelhub::test::write_file(storage / "notes.txt", "mine");

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/primary"), storage);
    entry.source.backup_urls = {server.hf_url("org/backup")};

    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE(modelhub::test::read_file(storage / "model.bin") == "weights");
    REQUIRE(modelhub::test::read_file(storage / "notes.txt") == "mine");
    REQUIRE_FALSE(fs::exists(storage / "extra.json"));
    REQUIRE_FALSE(fs::exists(storage / "weights"));
}

TEST_CASE("File downloads carry the bearer token") {
    TempDir home;
    EnvVarGuard home_guard("HOME", home.path().string());
    EnvVarGuard token_guard("HF_TOKEN", std::string("hf_session"));
    FakeHubServer server;
    server.add_file("org/model", "model.bin", "weights");
    TempDir tmp;

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), tmp.path() / "alpha"));
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE(server.file_requests() == 1);
    REQUIRE(server.last_authorization() == "Bearer hf_session");
}

TEST_CASE("Missing URL fails without network access") {
    IsolatedHome isolated;
    TempDir tmp;
    auto entry = make_entry("alpha", SourceKind::DIRECT_URL, "", tmp.path() / "alpha");

    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE(session.error_message().find("No download URL") != std::string::npos);
}

TEST_CASE("Cancellation stops the worker and removes the partial download") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "a.bin", std::string(64 * 1024, 'a'));
    server.add_file("org/model", "b.bin", std::string(2 * 1024 * 1024, 'b'));
    server.set_chunk_delay(std::chrono::milliseconds(20));
    TempDir tmp;
    auto storage = tmp.path() / "alpha";

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), storage));

    REQUIRE(wait_until([&]() { return session.snapshot().file_index == 1 && session.bytes_transferred() > 64 * 1024; }));
    session.cancel();
    session.join();

    REQUIRE(session.is_cancelled());
    REQUIRE_FALSE(session.is_failed());
    REQUIRE_FALSE(session.is_completed());
    REQUIRE_FALSE(session.is_active());
    REQUIRE(session.error_message().empty());
    REQUIRE_FALSE(fs::exists(storage));
}

TEST_CASE("Cancelling during the first file leaves no residual files") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "model.bin", std::string(2 * 1024 * 1024, 'm'));
    server.set_chunk_delay(std::chrono::milliseconds(20));
    TempDir tmp;
    auto storage = tmp.path() / "alpha";

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), storage));

    REQUIRE(wait_until([&]() { return session.bytes_transferred() > 0; }));
    session.cancel();
    session.join();

    REQUIRE(session.is_cancelled());
    REQUIRE_FALSE(fs::exists(storage));
}

TEST_CASE("Cancel after completion does not turn success into cancellation") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "model.bin", "tiny");
    TempDir tmp;

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), tmp.path() / "alpha"));
    session.join();
    session.cancel();

    REQUIRE(session.is_completed());
    REQUIRE(session.is_cancel_requested());
    REQUIRE_FALSE(session.is_cancelled());
}

TEST_CASE("Reset clears every field and can be repeated") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "model.bin", "tiny");
    TempDir tmp;
    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), tmp.path() / "alpha");

    DownloadSession session("alpha");
    session.start(entry);
    session.join();
    REQUIRE(session.is_completed());

    session.reset();
    session.reset();

    auto snap = session.snapshot();
    REQUIRE_FALSE(snap.active);
    REQUIRE_FALSE(snap.completed);
    REQUIRE_FALSE(snap.failed);
    REQUIRE_FALSE(snap.cancel_requested);
    REQUIRE(snap.bytes_transferred == 0);
    REQUIRE(snap.bytes_total == 0);
    REQUIRE(snap.current_file.empty());
    REQUIRE(snap.error_message.empty());

    // A reset session can be started again
    session.start(entry);
    session.join();
    REQUIRE(session.is_completed());
}

TEST_CASE("Transferred bytes never exceed the known total") {
    IsolatedHome isolated;
    FakeHubServer server;
    for (int i = 0; i < 4; ++i) {
        server.add_file("org/model", "shard-" + std::to_string(i) + ".bin", std::string(96 * 1024, static_cast<char>('a' + i)));
    }
    server.set_chunk_delay(std::chrono::milliseconds(2));
    TempDir tmp;

    DownloadSession session("alpha");
    session.start(make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), tmp.path() / "alpha"));

    size_t samples = 0;
    bool violated = false;
    while (session.is_active()) {
        auto snap = session.snapshot();
        if (snap.bytes_total > 0 && snap.bytes_transferred > snap.bytes_total) {
            violated = true;
        }
        if (snap.fraction() < 0.0 || snap.fraction() > 1.0) {
            violated = true;
        }
        samples++;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    session.join();

    REQUIRE(samples > 0);
    REQUIRE_FALSE(violated);
    REQUIRE(session.is_completed());
}

TEST_CASE("Conversion source downloads to staging and converts into storage") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("iic/paraformer", "model.pt", std::string(4096, 'p'));
    server.add_file("iic/paraformer", "config.yaml", "encoder: sanm");
    server.add_file("iic/paraformer", "am.mvn", "mvn");
    server.add_file("iic/paraformer", "example/sample.wav", "riff");
    TempDir tmp;
    auto storage = tmp.path() / "paraformer";
    auto staging_root = tmp.path() / "staging";
    fs::create_directories(staging_root);

    auto entry = make_entry("paraformer", SourceKind::MODEL_SCOPE, server.ms_url("iic/paraformer"), storage);
    entry.source.revision = "master";
    entry.source.convert = "paraformer";

    DownloadSession session("paraformer");
    session.set_staging_root(staging_root.string());
    session.start(entry);
    session.join();

    REQUIRE(session.is_completed());
    REQUIRE(session.bytes_transferred() == session.bytes_total());
    REQUIRE(fs::exists(storage / "model.pt"));
    REQUIRE(fs::exists(storage / "config.yaml"));
    REQUIRE(fs::exists(storage / "am.mvn"));
    REQUIRE(fs::exists(storage / "conversion.json"));
    REQUIRE_FALSE(fs::exists(storage / "example"));
    REQUIRE(fs::is_empty(staging_root));
}

TEST_CASE("Conversion failure fails the session and removes staging") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("iic/paraformer", "config.yaml", "encoder: sanm");
    TempDir tmp;
    auto storage = tmp.path() / "paraformer";
    auto staging_root = tmp.path() / "staging";
    fs::create_directories(staging_root);

    auto entry = make_entry("paraformer", SourceKind::MODEL_SCOPE, server.ms_url("iic/paraformer"), storage);
    entry.source.convert = "paraformer";
    entry.source.backup_urls = {server.ms_url("iic/paraformer")};

    DownloadSession session("paraformer");
    session.set_staging_root(staging_root.string());
    session.start(entry);
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE(session.error_message().find("No weight files") != std::string::npos);
    // The mirror is not tried after a conversion failure
    REQUIRE(server.listing_requests() == 1);
    REQUIRE(fs::is_empty(staging_root));
    REQUIRE_FALSE(fs::exists(storage));
}

TEST_CASE("Unknown conversion routine fails before any request") {
    IsolatedHome isolated;
    FakeHubServer server;
    server.add_file("org/model", "model.pt", "w");
    TempDir tmp;

    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, server.hf_url("org/model"), tmp.path() / "alpha");
    entry.source.convert = "onnx-magic";

    DownloadSession session("alpha");
    session.start(entry);
    session.join();

    REQUIRE(session.is_failed());
    REQUIRE(session.error_message().find("onnx-magic") != std::string::npos);
    REQUIRE(server.listing_requests() == 0);
}
