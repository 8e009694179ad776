#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace modelhub {

using json = nlohmann::json;

// Broad category that drives filtering in the catalog views
enum class ModelCategory {
    LLM,
    VLM,
    ASR,
    TTS,
    IMAGE_GEN
};

// Where the files of a model come from
enum class SourceKind {
    HUGGING_FACE,   // tree-style listing API
    MODEL_SCOPE,    // recursive file-listing API
    DIRECT_URL,     // one file at a fixed URL
    MANUAL          // requires manual installation, never fetched
};

// Persisted status of an installed model
enum class ModelState {
    NOT_AVAILABLE,
    DOWNLOADING,
    READY,
    PARTIAL,
    ERROR
};

std::string category_to_string(ModelCategory category);
ModelCategory category_from_string(const std::string& str);
std::string category_label(ModelCategory category);

std::string source_kind_to_string(SourceKind kind);
SourceKind source_kind_from_string(const std::string& str);

std::string model_state_to_string(ModelState state);
ModelState model_state_from_string(const std::string& str);
std::string model_state_label(ModelState state);

struct ModelSource {
    SourceKind kind = SourceKind::HUGGING_FACE;
    std::string repo_id;                   // e.g. "mlx-community/Qwen3-8B-bf16"
    std::string url;                       // primary URL, derived from repo_id when empty
    std::vector<std::string> backup_urls;  // mirrors tried in order after the primary
    std::string revision = "main";         // branch, tag or commit
    std::string convert;                   // post-download conversion routine, empty for none

    // Primary first, then backups
    std::vector<std::string> candidate_urls() const;
};

struct ModelStorage {
    std::string local_path;   // may start with "~/"
    uint64_t size_bytes = 0;  // informational, 0 = unknown
    std::string size_display;

    std::string expanded_path() const;
};

struct RuntimeRequirements {
    std::string api_type;
    std::string api_model_id;
    double memory_gb = 0.0;
    std::vector<std::string> platforms;
    bool supports_images = false;
    bool supports_streaming = true;
    std::string quantization;
};

struct ModelFileInfo {
    std::string path;
    uint64_t size_bytes = 0;
    bool downloaded = false;
};

struct ModelStatusInfo {
    ModelState state = ModelState::NOT_AVAILABLE;
    uint64_t downloaded_bytes = 0;
    size_t downloaded_files = 0;
    size_t total_files = 0;
    std::string last_checked;
    std::string last_downloaded;
    std::string error_message;
};

struct ModelEntry {
    std::string id;
    std::string name;
    std::string description;
    ModelCategory category = ModelCategory::LLM;
    std::vector<std::string> tags;
    ModelSource source;
    ModelStorage storage;
    RuntimeRequirements runtime;

    // Only meaningful in the local models config
    ModelStatusInfo status;
    std::vector<ModelFileInfo> files;

    // Entries with a file list are rescanned file by file
    bool is_file_count_sensitive() const { return !files.empty(); }
};

struct Catalog {
    std::string version;
    std::vector<ModelEntry> models;
};

// One file reported by a remote lister
struct RemoteFile {
    std::string path;   // relative to the model root
    uint64_t size = 0;  // 0 when the server does not report it
};

// JSON conversion. Catalog documents never carry status or files; the local
// models config does.
ModelEntry model_entry_from_json(const json& j);
json model_entry_to_json(const ModelEntry& entry, bool include_local_state = false);

Catalog catalog_from_json(const json& j);
json catalog_to_json(const Catalog& catalog);

} // namespace modelhub
