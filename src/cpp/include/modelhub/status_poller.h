#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "download_session.h"

namespace modelhub {

// Receives the terminal outcome of a drained session
class StatusSink {
public:
    virtual ~StatusSink() = default;

    virtual void on_completed(const std::string& model_id) = 0;
    virtual void on_failed(const std::string& model_id, const std::string& error_message) = 0;
    virtual void on_cancelled(const std::string& model_id) = 0;
};

// Live sessions keyed by model id, owned by the front end
using SessionMap = std::map<std::string, std::unique_ptr<DownloadSession>>;

struct ProgressView {
    std::string model_id;
    double fraction = 0.0;
    std::string text;
    size_t file_index = 0;
    size_t total_files = 0;
};

struct TickResult {
    bool needs_another_tick = false;
    std::vector<ProgressView> progress;  // sessions still active after this tick
    std::vector<std::string> completed;
    std::vector<std::pair<std::string, std::string>> failed;  // id, error
    std::vector<std::string> cancelled;
};

class StatusPoller {
public:
    // Drain terminal sessions into the sink (which may be null) and project
    // the active ones. Sessions are erased from the map once drained.
    static TickResult tick(SessionMap& sessions, StatusSink* sink);
};

// One console line for all active sessions: "a [1/3] 12.0% ... | b ...".
// The file counter is left out until the listing has produced a total.
std::string format_progress_line(const std::vector<ProgressView>& progress);

// "512 B", "1.50 KB", "3.25 GB"
std::string format_bytes(uint64_t bytes);

} // namespace modelhub
