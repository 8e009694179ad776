#include <catch2/catch.hpp>

#include <modelhub/filesystem_reconciler.h>
#include "test_helpers.h"

using namespace modelhub;
using modelhub::test::TempDir;
using modelhub::test::make_entry;
using modelhub::test::write_file;

namespace fs = std::filesystem;

TEST_CASE("Missing or empty storage is not downloaded") {
    TempDir tmp;
    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, "https://h/o/r", tmp.path() / "alpha");
    REQUIRE(FilesystemReconciler::scan(entry) == DiskPresence::NOT_DOWNLOADED);

    fs::create_directories(tmp.path() / "alpha");
    REQUIRE(FilesystemReconciler::scan(entry) == DiskPresence::NOT_DOWNLOADED);
}

TEST_CASE("Hidden entries alone do not count as a download") {
    TempDir tmp;
    auto dir = tmp.path() / "alpha";
    write_file(dir / ".DS_Store", "x");
    write_file(dir / ".cache" / "lock", "x");
    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, "https://h/o/r", dir);

    REQUIRE(FilesystemReconciler::scan(entry) == DiskPresence::NOT_DOWNLOADED);

    write_file(dir / "config.json", "{}");
    REQUIRE(FilesystemReconciler::scan(entry) == DiskPresence::DOWNLOADED);
}

TEST_CASE("Measure counts top-level entries and nested bytes") {
    TempDir tmp;
    auto dir = tmp.path() / "alpha";
    write_file(dir / "config.json", std::string(10, 'c'));
    write_file(dir / "weights" / "a.bin", std::string(100, 'a'));
    write_file(dir / "weights" / "deep" / "b.bin", std::string(50, 'b'));
    write_file(dir / ".hidden", std::string(1000, 'h'));
    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, "https://h/o/r", dir);

    DiskUsage usage = FilesystemReconciler::measure(entry);
    REQUIRE(usage.entries == 2);
    REQUIRE(usage.bytes == 160);
}

TEST_CASE("File list scan applies the 99 percent rule") {
    TempDir tmp;
    auto dir = tmp.path() / "sovits";
    auto entry = make_entry("sovits", SourceKind::MANUAL, "", dir);
    entry.files = {
        {"s1.ckpt", 1000, false},
        {"s2.pth", 1000, false},
        {"nested/config.json", 0, false}
    };

    SECTION("nothing on disk") {
        auto result = FilesystemReconciler::scan_files(entry);
        REQUIRE(result.state == ModelState::NOT_AVAILABLE);
        REQUIRE(result.total_files == 3);
        REQUIRE(result.downloaded_files == 0);
    }

    SECTION("one file short by more than one percent") {
        write_file(dir / "s1.ckpt", std::string(990, 'x'));
        write_file(dir / "s2.pth", std::string(989, 'x'));
        write_file(dir / "nested" / "config.json", "{}");

        auto result = FilesystemReconciler::scan_files(entry);
        REQUIRE(result.state == ModelState::PARTIAL);
        REQUIRE(result.downloaded_files == 2);
        REQUIRE(result.downloaded_bytes == 992);
        REQUIRE(entry.files[0].downloaded);
        REQUIRE_FALSE(entry.files[1].downloaded);
        // Unknown expected size accepts any size
        REQUIRE(entry.files[2].downloaded);
    }

    SECTION("all files present") {
        write_file(dir / "s1.ckpt", std::string(1000, 'x'));
        write_file(dir / "s2.pth", std::string(1200, 'x'));
        write_file(dir / "nested" / "config.json", "{}");

        auto result = FilesystemReconciler::scan_files(entry);
        REQUIRE(result.state == ModelState::READY);
        REQUIRE(result.downloaded_files == 3);
    }
}

TEST_CASE("Reconcile overwrites the persisted status from disk") {
    TempDir tmp;
    auto dir = tmp.path() / "alpha";
    auto entry = make_entry("alpha", SourceKind::HUGGING_FACE, "https://h/o/r", dir);

    SECTION("stale downloading state without files") {
        entry.status.state = ModelState::DOWNLOADING;
        entry.status.downloaded_bytes = 12345;
        FilesystemReconciler::reconcile(entry);

        REQUIRE(entry.status.state == ModelState::NOT_AVAILABLE);
        REQUIRE(entry.status.downloaded_bytes == 0);
        REQUIRE_FALSE(entry.status.last_checked.empty());
    }

    SECTION("error state with files on disk becomes ready") {
        write_file(dir / "model.bin", std::string(64, 'm'));
        entry.status.state = ModelState::ERROR;
        entry.status.error_message = "timeout";
        FilesystemReconciler::reconcile(entry);

        REQUIRE(entry.status.state == ModelState::READY);
        REQUIRE(entry.status.downloaded_bytes == 64);
        REQUIRE(entry.status.downloaded_files == 1);
        REQUIRE(entry.status.error_message.empty());
    }

    SECTION("partial file list keeps its error message") {
        entry.files = {{"a.bin", 10, false}, {"b.bin", 10, false}};
        write_file(dir / "a.bin", std::string(10, 'a'));
        entry.status.error_message = "interrupted";
        FilesystemReconciler::reconcile(entry);

        REQUIRE(entry.status.state == ModelState::PARTIAL);
        REQUIRE(entry.status.downloaded_files == 1);
        REQUIRE(entry.status.total_files == 2);
        REQUIRE(entry.status.error_message == "interrupted");
    }
}
