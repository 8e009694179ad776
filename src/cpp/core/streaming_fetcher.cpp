#include <modelhub/streaming_fetcher.h>
#include <modelhub/error_types.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace modelhub {

using utils::HttpClient;

static void remove_partial(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[StreamingFetcher] Warning: Could not remove partial file "
                  << path << ": " << ec.message() << std::endl;
    }
}

StreamingFetcher::StreamingFetcher(utils::DownloadOptions options)
    : options_(options) {
}

uint64_t StreamingFetcher::fetch(const std::string& url,
                                 const std::string& dest_path,
                                 const std::atomic<bool>& cancel_signal,
                                 ChunkCallback on_chunk,
                                 const std::map<std::string, std::string>& headers) const {
    if (cancel_signal.load()) {
        throw CancelledError();
    }

    fs::path parent = fs::path(dest_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw FilesystemError("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    utils::ProgressCallback progress = [&](size_t downloaded, size_t /*total*/) -> bool {
        if (cancel_signal.load()) {
            return false;
        }
        if (on_chunk) {
            on_chunk(static_cast<uint64_t>(downloaded));
        }
        return true;
    };

    auto result = HttpClient::download_file(url, dest_path, progress, headers, options_);

    if (result.cancelled) {
        remove_partial(dest_path);
        throw CancelledError();
    }

    if (!result.success) {
        remove_partial(dest_path);
        std::string context = "Failed to download " + url + " to " + dest_path + ": " + result.error_message;
        if (result.local_error) {
            throw FilesystemError(context);
        }
        throw NetworkError(context);
    }

    return result.bytes_written;
}

} // namespace modelhub
