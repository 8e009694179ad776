#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace modelhub::utils {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string error_message;                   // transport error, empty on success

    bool ok() const { return error_message.empty() && status_code >= 200 && status_code < 300; }
};

struct RequestOptions {
    long timeout_seconds = 60;
    long connect_timeout = 30;
};

struct DownloadOptions {
    long timeout_seconds = 3600;   // absolute limit for one file
    long connect_timeout = 60;
    long low_speed_limit = 1024;   // bytes/s, 0 disables
    long low_speed_time = 60;      // seconds below the limit before aborting
    size_t buffer_size = 65536;    // receive chunk size
};

struct DownloadResult {
    bool success = false;
    bool cancelled = false;
    bool local_error = false;  // the output file could not be opened or written
    int status_code = 0;
    uint64_t bytes_written = 0;
    std::string error_message;
};

// Receives (bytes received so far, expected total or 0). Return false to cancel.
using ProgressCallback = std::function<bool(size_t, size_t)>;

class HttpClient {
public:
    static HttpResponse get(const std::string& url,
                            const std::map<std::string, std::string>& headers = {},
                            const RequestOptions& options = RequestOptions());

    static HttpResponse head(const std::string& url,
                             const std::map<std::string, std::string>& headers = {},
                             const RequestOptions& options = RequestOptions());

    // Stream a GET body into output_path. The callback runs once per received
    // chunk before it is written; returning false aborts with cancelled=true.
    // The output file is truncated, never resumed.
    static DownloadResult download_file(const std::string& url,
                                        const std::string& output_path,
                                        ProgressCallback progress_callback = nullptr,
                                        const std::map<std::string, std::string>& headers = {},
                                        const DownloadOptions& options = DownloadOptions());

    // Percent-encode one query parameter value
    static std::string url_encode(const std::string& value);
};

} // namespace modelhub::utils
