#include <modelhub/model_types.h>
#include <modelhub/error_types.h>
#include <modelhub/utils/json_utils.h>
#include <modelhub/utils/path_utils.h>

namespace modelhub {

using utils::JsonUtils;

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Format: return "format";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::Conversion: return "conversion";
    }
    return "unknown";
}

std::string category_to_string(ModelCategory category) {
    switch (category) {
        case ModelCategory::LLM: return "llm";
        case ModelCategory::VLM: return "vlm";
        case ModelCategory::ASR: return "asr";
        case ModelCategory::TTS: return "tts";
        case ModelCategory::IMAGE_GEN: return "image_gen";
    }
    return "llm";
}

ModelCategory category_from_string(const std::string& str) {
    if (str == "llm") return ModelCategory::LLM;
    if (str == "vlm") return ModelCategory::VLM;
    if (str == "asr") return ModelCategory::ASR;
    if (str == "tts") return ModelCategory::TTS;
    if (str == "image_gen") return ModelCategory::IMAGE_GEN;
    throw FormatError("Unknown model category: " + str);
}

std::string category_label(ModelCategory category) {
    switch (category) {
        case ModelCategory::LLM: return "LLM";
        case ModelCategory::VLM: return "VLM";
        case ModelCategory::ASR: return "ASR";
        case ModelCategory::TTS: return "TTS";
        case ModelCategory::IMAGE_GEN: return "Image";
    }
    return "LLM";
}

std::string source_kind_to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::HUGGING_FACE: return "hugging_face";
        case SourceKind::MODEL_SCOPE: return "model_scope";
        case SourceKind::DIRECT_URL: return "direct_url";
        case SourceKind::MANUAL: return "manual";
    }
    return "hugging_face";
}

SourceKind source_kind_from_string(const std::string& str) {
    if (str == "hugging_face") return SourceKind::HUGGING_FACE;
    if (str == "model_scope") return SourceKind::MODEL_SCOPE;
    if (str == "direct_url") return SourceKind::DIRECT_URL;
    if (str == "manual") return SourceKind::MANUAL;
    throw FormatError("Unknown source kind: " + str);
}

std::string model_state_to_string(ModelState state) {
    switch (state) {
        case ModelState::NOT_AVAILABLE: return "not_available";
        case ModelState::DOWNLOADING: return "downloading";
        case ModelState::READY: return "ready";
        case ModelState::PARTIAL: return "partial";
        case ModelState::ERROR: return "error";
    }
    return "not_available";
}

ModelState model_state_from_string(const std::string& str) {
    if (str == "downloading") return ModelState::DOWNLOADING;
    if (str == "ready") return ModelState::READY;
    if (str == "partial") return ModelState::PARTIAL;
    if (str == "error") return ModelState::ERROR;
    return ModelState::NOT_AVAILABLE;
}

std::string model_state_label(ModelState state) {
    switch (state) {
        case ModelState::NOT_AVAILABLE: return "Not Downloaded";
        case ModelState::DOWNLOADING: return "Downloading";
        case ModelState::READY: return "Ready";
        case ModelState::PARTIAL: return "Partial";
        case ModelState::ERROR: return "Error";
    }
    return "Not Downloaded";
}

std::vector<std::string> ModelSource::candidate_urls() const {
    std::vector<std::string> urls;
    std::string primary = url;
    if (primary.empty() && !repo_id.empty()) {
        if (kind == SourceKind::HUGGING_FACE) {
            primary = "https://huggingface.co/" + repo_id;
        } else if (kind == SourceKind::MODEL_SCOPE) {
            primary = "https://modelscope.cn/models/" + repo_id;
        }
    }
    if (!primary.empty()) {
        urls.push_back(primary);
    }
    for (const auto& backup : backup_urls) {
        urls.push_back(backup);
    }
    return urls;
}

std::string ModelStorage::expanded_path() const {
    return utils::expand_home(local_path);
}

static ModelSource source_from_json(const json& j) {
    ModelSource source;
    source.kind = source_kind_from_string(JsonUtils::get_or_default<std::string>(j, "kind", "hugging_face"));
    source.repo_id = JsonUtils::get_or_default<std::string>(j, "repo_id", "");
    source.url = JsonUtils::get_or_default<std::string>(j, "url", "");
    source.backup_urls = JsonUtils::get_or_default(j, "backup_urls", std::vector<std::string>{});
    source.revision = JsonUtils::get_or_default<std::string>(j, "revision", "main");
    source.convert = JsonUtils::get_or_default<std::string>(j, "convert", "");
    return source;
}

static json source_to_json(const ModelSource& source) {
    json j;
    j["kind"] = source_kind_to_string(source.kind);
    if (!source.repo_id.empty()) {
        j["repo_id"] = source.repo_id;
    }
    if (!source.url.empty()) {
        j["url"] = source.url;
    }
    j["backup_urls"] = source.backup_urls;
    j["revision"] = source.revision;
    if (!source.convert.empty()) {
        j["convert"] = source.convert;
    }
    return j;
}

static RuntimeRequirements runtime_from_json(const json& j) {
    RuntimeRequirements runtime;
    runtime.api_type = JsonUtils::get_or_default<std::string>(j, "api_type", "");
    runtime.api_model_id = JsonUtils::get_or_default<std::string>(j, "api_model_id", "");
    runtime.memory_gb = JsonUtils::get_or_default(j, "memory_gb", 0.0);
    runtime.platforms = JsonUtils::get_or_default(j, "platforms", std::vector<std::string>{});
    runtime.supports_images = JsonUtils::get_or_default(j, "supports_images", false);
    runtime.supports_streaming = JsonUtils::get_or_default(j, "supports_streaming", true);
    runtime.quantization = JsonUtils::get_or_default<std::string>(j, "quantization", "");
    return runtime;
}

static json runtime_to_json(const RuntimeRequirements& runtime) {
    json j;
    j["api_type"] = runtime.api_type;
    j["api_model_id"] = runtime.api_model_id;
    j["memory_gb"] = runtime.memory_gb;
    j["platforms"] = runtime.platforms;
    j["supports_images"] = runtime.supports_images;
    j["supports_streaming"] = runtime.supports_streaming;
    if (!runtime.quantization.empty()) {
        j["quantization"] = runtime.quantization;
    }
    return j;
}

ModelEntry model_entry_from_json(const json& j) {
    if (!j.is_object()) {
        throw FormatError("Model entry must be a JSON object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        throw FormatError("Model entry is missing 'id'");
    }

    ModelEntry entry;
    entry.id = j["id"].get<std::string>();
    entry.name = JsonUtils::get_or_default<std::string>(j, "name", entry.id);
    entry.description = JsonUtils::get_or_default<std::string>(j, "description", "");
    entry.category = category_from_string(JsonUtils::get_or_default<std::string>(j, "category", "llm"));
    entry.tags = JsonUtils::get_or_default(j, "tags", std::vector<std::string>{});

    if (!j.contains("source") || !j["source"].is_object()) {
        throw FormatError("Model '" + entry.id + "' is missing 'source'");
    }
    entry.source = source_from_json(j["source"]);

    if (!j.contains("storage") || !j["storage"].is_object()) {
        throw FormatError("Model '" + entry.id + "' is missing 'storage'");
    }
    const json& storage = j["storage"];
    entry.storage.local_path = JsonUtils::get_or_default<std::string>(storage, "local_path", "");
    entry.storage.size_bytes = JsonUtils::get_or_default<uint64_t>(storage, "size_bytes", 0);
    entry.storage.size_display = JsonUtils::get_or_default<std::string>(storage, "size_display", "");
    if (entry.storage.local_path.empty()) {
        throw FormatError("Model '" + entry.id + "' has an empty storage path");
    }

    if (j.contains("runtime") && j["runtime"].is_object()) {
        entry.runtime = runtime_from_json(j["runtime"]);
    }

    if (j.contains("status") && j["status"].is_object()) {
        const json& status = j["status"];
        entry.status.state = model_state_from_string(
            JsonUtils::get_or_default<std::string>(status, "state", "not_available"));
        entry.status.downloaded_bytes = JsonUtils::get_or_default<uint64_t>(status, "downloaded_bytes", 0);
        entry.status.downloaded_files = JsonUtils::get_or_default<size_t>(status, "downloaded_files", 0);
        entry.status.total_files = JsonUtils::get_or_default<size_t>(status, "total_files", 0);
        entry.status.last_checked = JsonUtils::get_or_default<std::string>(status, "last_checked", "");
        entry.status.last_downloaded = JsonUtils::get_or_default<std::string>(status, "last_downloaded", "");
        entry.status.error_message = JsonUtils::get_or_default<std::string>(status, "error_message", "");
    }

    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& f : j["files"]) {
            ModelFileInfo info;
            info.path = JsonUtils::get_or_default<std::string>(f, "path", "");
            info.size_bytes = JsonUtils::get_or_default<uint64_t>(f, "size_bytes", 0);
            info.downloaded = JsonUtils::get_or_default(f, "downloaded", false);
            if (!info.path.empty()) {
                entry.files.push_back(info);
            }
        }
    }

    return entry;
}

json model_entry_to_json(const ModelEntry& entry, bool include_local_state) {
    json j;
    j["id"] = entry.id;
    j["name"] = entry.name;
    j["description"] = entry.description;
    j["category"] = category_to_string(entry.category);
    j["tags"] = entry.tags;
    j["source"] = source_to_json(entry.source);
    j["storage"] = {
        {"local_path", entry.storage.local_path},
        {"size_bytes", entry.storage.size_bytes},
        {"size_display", entry.storage.size_display}
    };
    j["runtime"] = runtime_to_json(entry.runtime);

    if (include_local_state) {
        json status;
        status["state"] = model_state_to_string(entry.status.state);
        status["downloaded_bytes"] = entry.status.downloaded_bytes;
        status["downloaded_files"] = entry.status.downloaded_files;
        status["total_files"] = entry.status.total_files;
        if (!entry.status.last_checked.empty()) {
            status["last_checked"] = entry.status.last_checked;
        }
        if (!entry.status.last_downloaded.empty()) {
            status["last_downloaded"] = entry.status.last_downloaded;
        }
        if (!entry.status.error_message.empty()) {
            status["error_message"] = entry.status.error_message;
        }
        j["status"] = status;

        if (!entry.files.empty()) {
            json files = json::array();
            for (const auto& f : entry.files) {
                files.push_back({{"path", f.path}, {"size_bytes", f.size_bytes}, {"downloaded", f.downloaded}});
            }
            j["files"] = files;
        }
    }
    return j;
}

Catalog catalog_from_json(const json& j) {
    if (!j.is_object() || !j.contains("models") || !j["models"].is_array()) {
        throw FormatError("Catalog document must contain a 'models' array");
    }

    Catalog catalog;
    catalog.version = JsonUtils::get_or_default<std::string>(j, "version", "");
    for (const auto& m : j["models"]) {
        catalog.models.push_back(model_entry_from_json(m));
    }
    return catalog;
}

json catalog_to_json(const Catalog& catalog) {
    json models = json::array();
    for (const auto& entry : catalog.models) {
        models.push_back(model_entry_to_json(entry));
    }
    return {{"version", catalog.version}, {"models", models}};
}

} // namespace modelhub
