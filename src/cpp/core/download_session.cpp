#include <modelhub/download_session.h>
#include <modelhub/error_types.h>
#include <modelhub/filesystem_reconciler.h>
#include <modelhub/remote_lister.h>
#include <modelhub/streaming_fetcher.h>
#include <modelhub/weight_converter.h>
#include <modelhub/utils/path_utils.h>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace modelhub {

double SessionSnapshot::fraction() const {
    if (bytes_total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(bytes_transferred) / static_cast<double>(bytes_total));
}

std::string SessionSnapshot::progress_text() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (fraction() * 100.0) << "%  ("
        << (bytes_transferred / 1048576) << "/" << (bytes_total / 1048576) << " MB)";
    if (!current_file.empty()) {
        oss << "  " << current_file;
    }
    return oss.str();
}

namespace {

void remove_tree(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[DownloadSession] Warning: Could not remove " << path
                  << ": " << ec.message() << std::endl;
    }
}

// Deletes the files one attempt wrote below root, then the directories that
// this leaves empty. Root itself is kept.
void discard_files(const std::vector<std::string>& paths, const std::string& root) {
    const std::string base = fs::path(root).lexically_normal().string();
    for (const auto& path : paths) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            std::cerr << "[DownloadSession] Warning: Could not remove " << path
                      << ": " << ec.message() << std::endl;
            continue;
        }
        fs::path dir = fs::path(path).parent_path().lexically_normal();
        while (dir.string().size() > base.size() && fs::is_empty(dir, ec) && !ec) {
            if (!fs::remove(dir, ec) || ec) {
                break;
            }
            dir = dir.parent_path();
        }
    }
}

// Removes a directory tree when it goes out of scope
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::string path) : path_(std::move(path)) {}
    ~ScopedDirectory() {
        if (!path_.empty()) {
            remove_tree(path_);
        }
    }

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

private:
    std::string path_;
};

// Listed paths must stay inside the target directory
void check_relative_path(const std::string& path) {
    fs::path p(path);
    if (p.empty() || p.is_absolute()) {
        throw FormatError("Refusing to write listed file outside the model directory: " + path);
    }
    for (const auto& part : p) {
        if (part == "..") {
            throw FormatError("Refusing to write listed file outside the model directory: " + path);
        }
    }
}

} // namespace

DownloadSession::DownloadSession(std::string model_id, utils::DownloadOptions options)
    : model_id_(std::move(model_id)), options_(options) {
}

DownloadSession::~DownloadSession() {
    if (worker_.joinable()) {
        cancel_requested_ = true;
        worker_.join();
    }
}

void DownloadSession::start(const ModelEntry& entry) {
    if (entry.id != model_id_) {
        throw std::logic_error("Session for '" + model_id_ + "' cannot download '" + entry.id + "'");
    }
    if (active_) {
        throw std::logic_error("Download of '" + model_id_ + "' is already in progress");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    clear_fields();

    if (entry.source.kind == SourceKind::MANUAL) {
        std::cout << "[DownloadSession] " << model_id_ << " requires manual installation" << std::endl;
        finish_failed(MANUAL_INSTALL_MESSAGE);
        return;
    }

    std::cout << "[DownloadSession] Starting download for " << entry.name << std::endl;
    active_ = true;
    try {
        worker_ = std::thread(&DownloadSession::run, this, entry);
    } catch (const std::system_error& e) {
        finish_failed(std::string("Failed to start download worker: ") + e.what());
        active_ = false;
    }
}

void DownloadSession::cancel() {
    cancel_requested_ = true;
}

void DownloadSession::reset() {
    if (worker_.joinable()) {
        cancel_requested_ = true;
        worker_.join();
    }
    clear_fields();
}

void DownloadSession::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool DownloadSession::is_cancelled() const {
    return cancel_requested_ && !completed_ && !failed_;
}

std::string DownloadSession::current_file() const {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return current_file_;
}

std::string DownloadSession::error_message() const {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return error_message_;
}

SessionSnapshot DownloadSession::snapshot() const {
    SessionSnapshot snap;
    snap.model_id = model_id_;
    snap.active = active_;
    snap.cancel_requested = cancel_requested_;
    snap.completed = completed_;
    snap.failed = failed_;
    // Total first: writers raise it before raising transferred
    snap.bytes_total = bytes_total_;
    snap.bytes_transferred = bytes_transferred_;
    snap.file_index = file_index_;
    snap.total_files = total_files_;
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        snap.current_file = current_file_;
        snap.error_message = error_message_;
    }
    return snap;
}

void DownloadSession::clear_fields() {
    active_ = false;
    cancel_requested_ = false;
    completed_ = false;
    failed_ = false;
    bytes_transferred_ = 0;
    bytes_total_ = 0;
    file_index_ = 0;
    total_files_ = 0;
    std::lock_guard<std::mutex> lock(text_mutex_);
    current_file_.clear();
    error_message_.clear();
}

void DownloadSession::publish_total(uint64_t total, size_t files) {
    bytes_transferred_ = 0;
    bytes_total_ = total;
    total_files_ = files;
    file_index_ = 0;
}

void DownloadSession::publish_transferred(uint64_t transferred) {
    uint64_t total = bytes_total_;
    if (total > 0 && transferred > total) {
        transferred = total;
    }
    bytes_transferred_ = transferred;
}

void DownloadSession::set_current_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(text_mutex_);
    current_file_ = path;
}

void DownloadSession::finish_failed(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        error_message_ = message;
    }
    failed_ = true;
}

void DownloadSession::run(ModelEntry entry) {
    const ModelSource& source = entry.source;
    const std::string storage_dir = entry.storage.expanded_path();
    const bool converting = !source.convert.empty();

    std::unique_ptr<WeightConverter> converter;
    if (converting) {
        converter = make_converter(source.convert);
        if (!converter) {
            finish_failed("Unknown conversion routine '" + source.convert + "' for " + model_id_);
            active_ = false;
            return;
        }
    }

    std::unique_ptr<RemoteLister> lister;
    try {
        lister = make_lister(source.kind);
    } catch (const UnsupportedSourceError& e) {
        finish_failed(e.what());
        active_ = false;
        return;
    }

    // Only a directory that already held a model outlives a failed run
    const bool storage_had_model = FilesystemReconciler::scan(entry) == DiskPresence::DOWNLOADED;
    std::error_code ec;

    std::string staging_dir;
    if (converting) {
        fs::path root = staging_root_;
        if (root.empty()) {
            root = fs::temp_directory_path(ec);
            if (ec) {
                finish_failed("No temporary directory for staging: " + ec.message());
                active_ = false;
                return;
            }
        }
        staging_dir = (root / ("modelhub-" + model_id_)).string();
    }
    ScopedDirectory staging_guard(staging_dir);
    const std::string& attempt_dir = converting ? staging_dir : storage_dir;

    StreamingFetcher fetcher(options_);
    std::vector<std::string> candidates = source.candidate_urls();
    std::string last_error;
    if (candidates.empty()) {
        last_error = "No download URL configured for " + model_id_;
    }

    std::vector<std::string> written;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const std::string& url = candidates[i];
        written.clear();
        if (i > 0) {
            std::cout << "[DownloadSession] Trying backup URL " << i << ": " << url << std::endl;
        }

        try {
            if (cancel_requested_) {
                throw CancelledError();
            }
            if (converting) {
                remove_tree(staging_dir);
            }

            run_candidate(entry, url, *lister, fetcher, attempt_dir, written);

            if (converting) {
                if (cancel_requested_) {
                    throw CancelledError();
                }
                std::cout << "[DownloadSession] Converting " << model_id_ << " with "
                          << converter->name() << std::endl;
                converter->convert(staging_dir, storage_dir);
                bytes_transferred_ = bytes_total_.load();
            }

            completed_ = true;
            active_ = false;
            std::cout << "[DownloadSession] Download complete: " << storage_dir << std::endl;
            return;
        } catch (const CancelledError&) {
            remove_tree(attempt_dir);
            std::cout << "[DownloadSession] Download of " << model_id_ << " cancelled" << std::endl;
            active_ = false;
            return;
        } catch (const ConversionError& e) {
            last_error = e.what();
            std::cerr << "[DownloadSession] " << last_error << std::endl;
            break;
        } catch (const AcquisitionError& e) {
            last_error = e.what();
        } catch (const fs::filesystem_error& e) {
            last_error = e.what();
        }
        std::cerr << "[DownloadSession] Download failed from " << url << ": " << last_error << std::endl;
        // The next mirror starts from scratch
        if (!converting) {
            discard_files(written, storage_dir);
        }
    }

    if (!storage_had_model) {
        remove_tree(storage_dir);
    }
    finish_failed(last_error);
    active_ = false;
}

void DownloadSession::run_candidate(const ModelEntry& entry, const std::string& candidate_url,
                                    RemoteLister& lister, const StreamingFetcher& fetcher,
                                    const std::string& target_dir, std::vector<std::string>& written) {
    std::vector<RemoteFile> files = lister.list(entry.source, candidate_url);

    uint64_t download_size = 0;
    for (const auto& f : files) {
        download_size += f.size;
    }
    // Conversion is credited as an extra tenth of the download
    uint64_t total = entry.source.convert.empty() ? download_size : download_size + download_size / 10;
    publish_total(total, files.size());

    std::cout << "[DownloadSession] Total download size: " << download_size << " bytes ("
              << files.size() << " files)" << std::endl;

    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        throw FilesystemError("Failed to create model directory " + target_dir + ": " + ec.message());
    }

    const std::map<std::string, std::string> headers = utils::auth_headers();

    uint64_t done = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        const RemoteFile& file = files[i];
        if (cancel_requested_) {
            throw CancelledError();
        }
        check_relative_path(file.path);

        file_index_ = i;
        set_current_file(file.path);
        std::cout << "[DownloadSession] Downloading [" << (i + 1) << "/" << files.size() << "]: "
                  << file.path << std::endl;

        std::string file_url = lister.file_url(entry.source, candidate_url, file.path);
        std::string dest = (fs::path(target_dir) / file.path).string();
        written.push_back(dest);

        const uint64_t base = done;
        uint64_t written = fetcher.fetch(file_url, dest, cancel_requested_,
                                         [this, base](uint64_t n) { publish_transferred(base + n); },
                                         headers);
        done += written;
        publish_transferred(done);
    }
}

} // namespace modelhub
