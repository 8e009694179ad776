#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "model_types.h"

namespace modelhub {

// Host and repository parsed out of one candidate URL
struct RepoLocation {
    std::string host;     // scheme + authority, e.g. "https://hf-mirror.com"
    std::string repo_id;  // "owner/name"

    // Throws FormatError when the URL has no scheme, host or two repo segments
    static RepoLocation parse(const std::string& url, SourceKind kind);
};

// Lists the files that make up one model at one candidate URL
class RemoteLister {
public:
    virtual ~RemoteLister() = default;

    // Throws NetworkError or FormatError; never returns an empty list
    virtual std::vector<RemoteFile> list(const ModelSource& source, const std::string& candidate_url) = 0;

    // Download URL of one listed file
    virtual std::string file_url(const ModelSource& source, const std::string& candidate_url,
                                 const std::string& path) const = 0;
};

// Hugging Face style: GET {host}/api/models/{repo}/tree/{revision}[/{subpath}]
class TreeApiLister : public RemoteLister {
public:
    std::vector<RemoteFile> list(const ModelSource& source, const std::string& candidate_url) override;
    std::string file_url(const ModelSource& source, const std::string& candidate_url,
                         const std::string& path) const override;

private:
    void list_dir(const RepoLocation& loc, const std::string& revision, const std::string& subpath,
                  const std::map<std::string, std::string>& headers, std::vector<RemoteFile>& out);
};

// ModelScope style: GET {host}/api/v1/models/{repo}/repo/files?Revision=..&Root=..
class RecursiveApiLister : public RemoteLister {
public:
    std::vector<RemoteFile> list(const ModelSource& source, const std::string& candidate_url) override;
    std::string file_url(const ModelSource& source, const std::string& candidate_url,
                         const std::string& path) const override;

private:
    void list_dir(const RepoLocation& loc, const std::string& revision, const std::string& root,
                  const std::map<std::string, std::string>& headers, std::vector<RemoteFile>& out);
};

// The candidate URL is the single file; a HEAD request supplies its size
class DirectUrlLister : public RemoteLister {
public:
    std::vector<RemoteFile> list(const ModelSource& source, const std::string& candidate_url) override;
    std::string file_url(const ModelSource& source, const std::string& candidate_url,
                         const std::string& path) const override;
};

// Throws UnsupportedSourceError for manual sources
std::unique_ptr<RemoteLister> make_lister(SourceKind kind);

} // namespace modelhub
