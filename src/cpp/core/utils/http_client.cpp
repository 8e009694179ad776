#include <modelhub/utils/http_client.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <sstream>

namespace modelhub::utils {

static const char* USER_AGENT = "modelhub/1.0";

static void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

static size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

static size_t parse_header_line(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    std::string line(buffer, total);
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t start = value.find_first_not_of(" \t");
    size_t end = value.find_last_not_of(" \t\r\n");
    value = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);

    (*headers)[name] = value;
    return total;
}

static curl_slist* build_header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

static HttpResponse perform_request(const std::string& url,
                                    const std::map<std::string, std::string>& headers,
                                    const RequestOptions& options,
                                    bool head_only) {
    ensure_curl_initialized();

    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error_message = "Failed to initialize curl";
        return response;
    }

    curl_slist* header_list = build_header_list(headers);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, parse_header_line);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (head_only) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error_message = curl_easy_strerror(res);
    } else {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers,
                             const RequestOptions& options) {
    return perform_request(url, headers, options, false);
}

HttpResponse HttpClient::head(const std::string& url,
                              const std::map<std::string, std::string>& headers,
                              const RequestOptions& options) {
    return perform_request(url, headers, options, true);
}

namespace {

struct DownloadContext {
    FILE* file = nullptr;
    ProgressCallback* progress = nullptr;
    curl_off_t expected = 0;
    uint64_t written = 0;
    bool cancelled = false;
    bool write_failed = false;
    CURL* curl = nullptr;
};

} // namespace

static size_t write_chunk(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<DownloadContext*>(userp);
    size_t total = size * nmemb;

    // Checkpoint before the chunk is consumed
    if (ctx->progress && *ctx->progress) {
        curl_off_t expected = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &expected);
        ctx->expected = expected > 0 ? expected : 0;
        if (!(*ctx->progress)(static_cast<size_t>(ctx->written), static_cast<size_t>(ctx->expected))) {
            ctx->cancelled = true;
            return 0;
        }
    }

    size_t n = fwrite(contents, 1, total, ctx->file);
    if (n != total) {
        ctx->write_failed = true;
        return 0;
    }
    ctx->written += total;

    if (ctx->progress && *ctx->progress) {
        if (!(*ctx->progress)(static_cast<size_t>(ctx->written), static_cast<size_t>(ctx->expected))) {
            ctx->cancelled = true;
            return 0;
        }
    }
    return total;
}

DownloadResult HttpClient::download_file(const std::string& url,
                                         const std::string& output_path,
                                         ProgressCallback progress_callback,
                                         const std::map<std::string, std::string>& headers,
                                         const DownloadOptions& options) {
    ensure_curl_initialized();

    DownloadResult result;

    FILE* file = fopen(output_path.c_str(), "wb");
    if (!file) {
        result.local_error = true;
        result.error_message = "Failed to open output file: " + output_path;
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        fclose(file);
        result.error_message = "Failed to initialize curl";
        return result;
    }

    DownloadContext ctx;
    ctx.file = file;
    ctx.progress = &progress_callback;
    ctx.curl = curl;

    curl_slist* header_list = build_header_list(headers);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(options.buffer_size));
    if (options.low_speed_limit > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options.low_speed_time);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_chunk);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    result.status_code = static_cast<int>(code);
    result.bytes_written = ctx.written;

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    bool close_failed = (fclose(file) != 0);

    if (ctx.cancelled) {
        result.cancelled = true;
        result.error_message = "Download cancelled";
    } else if (ctx.write_failed) {
        result.local_error = true;
        result.error_message = "Failed to write to " + output_path;
    } else if (res == CURLE_HTTP_RETURNED_ERROR) {
        result.error_message = "HTTP " + std::to_string(code);
    } else if (res != CURLE_OK) {
        result.error_message = curl_easy_strerror(res);
    } else if (close_failed) {
        result.local_error = true;
        result.error_message = "Failed to flush " + output_path;
    } else {
        result.success = true;
    }

    return result;
}

std::string HttpClient::url_encode(const std::string& value) {
    std::ostringstream out;
    static const char* hex = "0123456789ABCDEF";
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out << c;
        } else {
            out << '%' << hex[c >> 4] << hex[c & 0x0F];
        }
    }
    return out.str();
}

} // namespace modelhub::utils
