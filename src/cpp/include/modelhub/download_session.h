#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "model_types.h"
#include "utils/http_client.h"

namespace modelhub {

class RemoteLister;
class StreamingFetcher;

constexpr const char* MANUAL_INSTALL_MESSAGE =
    "This model requires manual installation. See the model description for instructions.";

// Point-in-time copy of a session, taken without holding any lock across
// rendering. Fields are read one by one, so it is consistent enough for
// display, not transactional.
struct SessionSnapshot {
    std::string model_id;
    bool active = false;
    bool cancel_requested = false;
    bool completed = false;
    bool failed = false;
    uint64_t bytes_transferred = 0;
    uint64_t bytes_total = 0;      // 0 = unknown
    size_t file_index = 0;         // zero-based
    size_t total_files = 0;
    std::string current_file;
    std::string error_message;

    bool cancelled() const { return cancel_requested && !completed && !failed; }

    // transferred / total clamped to [0, 1], 0 when the total is unknown
    double fraction() const;

    // e.g. "42.0%  (120/300 MB)  model-00002-of-00004.safetensors"
    std::string progress_text() const;
};

// Shared state of one model acquisition plus the worker thread driving it.
// The control thread calls start/cancel/snapshot; the worker owns every
// write except cancel-requested.
class DownloadSession {
public:
    explicit DownloadSession(std::string model_id,
                             utils::DownloadOptions options = utils::DownloadOptions());
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Reset and begin acquiring entry on a worker thread. Manual sources fail
    // synchronously without a worker. Throws std::logic_error when the model
    // id differs or a worker is still active.
    void start(const ModelEntry& entry);

    // Cooperative; observed between chunks and between files
    void cancel();

    // Zero every field for a retry. Cancels and joins a running worker first.
    void reset();

    // Wait for the worker, if any
    void join();

    // Staging parent for conversion sources, defaults to the system temp dir
    void set_staging_root(const std::string& dir) { staging_root_ = dir; }

    const std::string& model_id() const { return model_id_; }

    bool is_active() const { return active_.load(); }
    bool is_completed() const { return completed_.load(); }
    bool is_failed() const { return failed_.load(); }
    bool is_cancel_requested() const { return cancel_requested_.load(); }
    bool is_cancelled() const;

    uint64_t bytes_transferred() const { return bytes_transferred_.load(); }
    uint64_t bytes_total() const { return bytes_total_.load(); }

    std::string current_file() const;
    std::string error_message() const;

    SessionSnapshot snapshot() const;
    double fraction() const { return snapshot().fraction(); }
    std::string progress_text() const { return snapshot().progress_text(); }

private:
    void run(ModelEntry entry);
    void run_candidate(const ModelEntry& entry, const std::string& candidate_url,
                       RemoteLister& lister, const StreamingFetcher& fetcher,
                       const std::string& target_dir, std::vector<std::string>& written);

    void publish_total(uint64_t total, size_t files);
    void publish_transferred(uint64_t transferred);
    void set_current_file(const std::string& path);
    void finish_failed(const std::string& message);
    void clear_fields();

    std::string model_id_;
    utils::DownloadOptions options_;
    std::string staging_root_;

    std::atomic<bool> active_{false};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> completed_{false};
    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> bytes_transferred_{0};
    std::atomic<uint64_t> bytes_total_{0};
    std::atomic<size_t> file_index_{0};
    std::atomic<size_t> total_files_{0};

    mutable std::mutex text_mutex_;
    std::string current_file_;
    std::string error_message_;

    std::thread worker_;
};

} // namespace modelhub
