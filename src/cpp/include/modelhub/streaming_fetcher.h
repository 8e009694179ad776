#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include "utils/http_client.h"

namespace modelhub {

// Receives the running byte count of the current file after each chunk
using ChunkCallback = std::function<void(uint64_t)>;

// Transfers one remote file to one local path in bounded chunks
class StreamingFetcher {
public:
    explicit StreamingFetcher(utils::DownloadOptions options = utils::DownloadOptions());

    // Returns the number of bytes written. Throws CancelledError when the
    // signal is raised, NetworkError or FilesystemError otherwise. The partial
    // file is removed on every failure.
    uint64_t fetch(const std::string& url,
                   const std::string& dest_path,
                   const std::atomic<bool>& cancel_signal,
                   ChunkCallback on_chunk = nullptr,
                   const std::map<std::string, std::string>& headers = {}) const;

    const utils::DownloadOptions& options() const { return options_; }

private:
    utils::DownloadOptions options_;
};

} // namespace modelhub
