#include <modelhub/remote_lister.h>
#include <modelhub/error_types.h>
#include <modelhub/utils/http_client.h>
#include <modelhub/utils/json_utils.h>
#include <modelhub/utils/path_utils.h>
#include <iostream>
#include <sstream>

namespace modelhub {

using utils::HttpClient;
using utils::JsonUtils;

static const long LISTING_TIMEOUT_SECONDS = 60;

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

static std::string strip_query(const std::string& url) {
    size_t pos = url.find_first_of("?#");
    return pos == std::string::npos ? url : url.substr(0, pos);
}

RepoLocation RepoLocation::parse(const std::string& url, SourceKind kind) {
    std::string clean = strip_query(url);

    size_t scheme_end = clean.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw FormatError("Invalid repository URL (no scheme): " + url);
    }

    size_t path_start = clean.find('/', scheme_end + 3);
    std::string host = clean.substr(0, path_start);
    if (host.size() <= scheme_end + 3) {
        throw FormatError("Invalid repository URL (no host): " + url);
    }

    std::vector<std::string> segments;
    if (path_start != std::string::npos) {
        segments = split_path(clean.substr(path_start));
    }

    size_t first = 0;
    if (kind == SourceKind::MODEL_SCOPE && !segments.empty() && segments[0] == "models") {
        first = 1;
    }
    if (segments.size() < first + 2) {
        throw FormatError("Invalid repository URL (expected owner/name): " + url);
    }

    RepoLocation loc;
    loc.host = host;
    loc.repo_id = segments[first] + "/" + segments[first + 1];
    return loc;
}

static json fetch_listing(const std::string& api_url, const std::map<std::string, std::string>& headers) {
    utils::RequestOptions options;
    options.timeout_seconds = LISTING_TIMEOUT_SECONDS;

    auto response = HttpClient::get(api_url, headers, options);
    if (!response.error_message.empty()) {
        throw NetworkError("Failed to list files from " + api_url + ": " + response.error_message);
    }
    if (!response.ok()) {
        throw NetworkError("Failed to list files from " + api_url +
                           ": HTTP " + std::to_string(response.status_code));
    }

    try {
        return JsonUtils::parse(response.body);
    } catch (const FormatError& e) {
        throw FormatError("Failed to parse file list from " + api_url + ": " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Tree listing
// ---------------------------------------------------------------------------

std::vector<RemoteFile> TreeApiLister::list(const ModelSource& source, const std::string& candidate_url) {
    RepoLocation loc = RepoLocation::parse(candidate_url, SourceKind::HUGGING_FACE);
    auto headers = utils::auth_headers();

    std::cout << "[RemoteLister] Listing " << loc.repo_id << " from " << loc.host
              << " (auth: " << (headers.empty() ? "no" : "yes") << ")" << std::endl;

    std::vector<RemoteFile> files;
    list_dir(loc, source.revision, "", headers, files);

    if (files.empty()) {
        throw FormatError("No files in repository " + loc.repo_id);
    }
    return files;
}

void TreeApiLister::list_dir(const RepoLocation& loc, const std::string& revision, const std::string& subpath,
                             const std::map<std::string, std::string>& headers, std::vector<RemoteFile>& out) {
    std::string api_url = loc.host + "/api/models/" + loc.repo_id + "/tree/" + HttpClient::url_encode(revision);
    if (!subpath.empty()) {
        api_url += "/" + HttpClient::url_encode(subpath);
    }

    json items = fetch_listing(api_url, headers);
    if (!items.is_array()) {
        throw FormatError("Unexpected tree listing from " + api_url + ": expected an array");
    }

    for (const auto& item : items) {
        std::string type = JsonUtils::get_or_default<std::string>(item, "type", "");
        std::string path = JsonUtils::get_or_default<std::string>(item, "path", "");
        if (path.empty()) {
            throw FormatError("Tree listing entry without a path from " + api_url);
        }

        if (type == "file") {
            out.push_back({path, JsonUtils::get_or_default<uint64_t>(item, "size", 0)});
        } else if (type == "directory") {
            list_dir(loc, revision, path, headers, out);
        }
    }
}

std::string TreeApiLister::file_url(const ModelSource& source, const std::string& candidate_url,
                                    const std::string& path) const {
    RepoLocation loc = RepoLocation::parse(candidate_url, SourceKind::HUGGING_FACE);
    return loc.host + "/" + loc.repo_id + "/resolve/" + HttpClient::url_encode(source.revision) +
           "/" + HttpClient::url_encode(path);
}

// ---------------------------------------------------------------------------
// Recursive listing
// ---------------------------------------------------------------------------

std::vector<RemoteFile> RecursiveApiLister::list(const ModelSource& source, const std::string& candidate_url) {
    RepoLocation loc = RepoLocation::parse(candidate_url, SourceKind::MODEL_SCOPE);
    auto headers = utils::auth_headers();

    std::cout << "[RemoteLister] Listing " << loc.repo_id << " from " << loc.host << std::endl;

    std::vector<RemoteFile> files;
    list_dir(loc, source.revision, "", headers, files);

    if (files.empty()) {
        throw FormatError("No files in repository " + loc.repo_id);
    }
    return files;
}

void RecursiveApiLister::list_dir(const RepoLocation& loc, const std::string& revision, const std::string& root,
                                  const std::map<std::string, std::string>& headers, std::vector<RemoteFile>& out) {
    std::string api_url = loc.host + "/api/v1/models/" + loc.repo_id + "/repo/files?Revision=" +
                          HttpClient::url_encode(revision);
    if (!root.empty()) {
        api_url += "&Root=" + HttpClient::url_encode(root);
    }

    json body = fetch_listing(api_url, headers);
    if (!body.is_object()) {
        throw FormatError("Unexpected file listing from " + api_url + ": expected an object");
    }

    int code = JsonUtils::get_or_default(body, "Code", 0);
    if (code != 200) {
        std::string message = JsonUtils::get_or_default<std::string>(body, "Message", "");
        throw NetworkError("Repository API error for " + loc.repo_id + ": code " + std::to_string(code) +
                           (message.empty() ? "" : " (" + message + ")"));
    }

    if (!body.contains("Data") || !body["Data"].is_object() ||
        !body["Data"].contains("Files") || !body["Data"]["Files"].is_array()) {
        throw FormatError("No file data in listing from " + api_url);
    }

    for (const auto& item : body["Data"]["Files"]) {
        std::string type = JsonUtils::get_or_default<std::string>(item, "Type", "");
        std::string path = JsonUtils::get_or_default<std::string>(item, "Path", "");
        if (path.empty()) {
            throw FormatError("File listing entry without a path from " + api_url);
        }

        if (type == "blob") {
            out.push_back({path, JsonUtils::get_or_default<uint64_t>(item, "Size", 0)});
        } else if (type == "tree") {
            list_dir(loc, revision, path, headers, out);
        }
    }
}

std::string RecursiveApiLister::file_url(const ModelSource& source, const std::string& candidate_url,
                                         const std::string& path) const {
    RepoLocation loc = RepoLocation::parse(candidate_url, SourceKind::MODEL_SCOPE);
    return loc.host + "/api/v1/models/" + loc.repo_id + "/repo?Revision=" +
           HttpClient::url_encode(source.revision) + "&FilePath=" + HttpClient::url_encode(path);
}

// ---------------------------------------------------------------------------
// Direct URL
// ---------------------------------------------------------------------------

std::vector<RemoteFile> DirectUrlLister::list(const ModelSource& /*source*/, const std::string& candidate_url) {
    std::string clean = strip_query(candidate_url);
    size_t scheme_end = clean.find("://");
    if (scheme_end == std::string::npos) {
        throw FormatError("Invalid download URL: " + candidate_url);
    }

    size_t slash = clean.find_last_of('/');
    if (slash == std::string::npos || slash <= scheme_end + 2 || slash + 1 >= clean.size()) {
        throw FormatError("Download URL has no file name: " + candidate_url);
    }

    RemoteFile file;
    file.path = clean.substr(slash + 1);

    utils::RequestOptions options;
    options.timeout_seconds = LISTING_TIMEOUT_SECONDS;
    auto response = HttpClient::head(candidate_url, utils::auth_headers(), options);
    if (response.ok()) {
        auto it = response.headers.find("content-length");
        if (it != response.headers.end()) {
            try {
                file.size = std::stoull(it->second);
            } catch (const std::exception&) {
                file.size = 0;
            }
        }
    } else {
        std::cout << "[RemoteLister] HEAD " << candidate_url << " failed, size unknown" << std::endl;
    }

    return {file};
}

std::string DirectUrlLister::file_url(const ModelSource& /*source*/, const std::string& candidate_url,
                                      const std::string& /*path*/) const {
    return candidate_url;
}

std::unique_ptr<RemoteLister> make_lister(SourceKind kind) {
    switch (kind) {
        case SourceKind::HUGGING_FACE:
            return std::make_unique<TreeApiLister>();
        case SourceKind::MODEL_SCOPE:
            return std::make_unique<RecursiveApiLister>();
        case SourceKind::DIRECT_URL:
            return std::make_unique<DirectUrlLister>();
        case SourceKind::MANUAL:
            break;
    }
    throw UnsupportedSourceError("Manual sources cannot be listed");
}

} // namespace modelhub
