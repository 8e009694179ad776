#include <modelhub/local_models_config.h>
#include <modelhub/error_types.h>
#include <modelhub/filesystem_reconciler.h>
#include <modelhub/utils/json_utils.h>
#include <modelhub/utils/path_utils.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace modelhub {

using utils::JsonUtils;

LocalModelsConfig::LocalModelsConfig(std::string path)
    : path_(std::move(path)) {
}

std::string LocalModelsConfig::default_path() {
    return (fs::path(utils::get_config_dir()) / "local_models_config.json").string();
}

void LocalModelsConfig::load(const std::vector<ModelEntry>& defaults) {
    models_.clear();
    version_ = LOCAL_CONFIG_VERSION;
    bool loaded = false;

    std::error_code ec;
    if (fs::exists(path_, ec)) {
        try {
            json doc = JsonUtils::load_from_file(path_);
            if (!doc.is_object() || !doc.contains("models") || !doc["models"].is_array()) {
                throw FormatError("missing 'models' array");
            }

            std::vector<ModelEntry> models;
            for (const auto& m : doc["models"]) {
                models.push_back(model_entry_from_json(m));
            }
            models_ = std::move(models);
            version_ = JsonUtils::get_or_default<std::string>(doc, "version", LOCAL_CONFIG_VERSION);
            last_updated_ = JsonUtils::get_or_default<std::string>(doc, "last_updated", "");
            loaded = true;
            std::cout << "[LocalModelsConfig] Loaded " << models_.size() << " models from " << path_ << std::endl;
        } catch (const AcquisitionError& e) {
            std::cerr << "[LocalModelsConfig] Failed to parse " << path_ << ": " << e.what() << std::endl;
        }
    }

    if (!loaded) {
        std::cout << "[LocalModelsConfig] Creating default config" << std::endl;
    }

    merge_with_defaults(defaults);
    startup_scan();
    save();
}

void LocalModelsConfig::merge_with_defaults(const std::vector<ModelEntry>& defaults) {
    for (const auto& def : defaults) {
        ModelEntry* existing = find(def.id);
        if (!existing) {
            models_.push_back(def);
            continue;
        }
        // The catalog owns the descriptor; only the local status and file list survive
        ModelStatusInfo status = existing->status;
        std::vector<ModelFileInfo> files = existing->files.empty() ? def.files : existing->files;
        *existing = def;
        existing->status = status;
        existing->files = std::move(files);
    }
}

void LocalModelsConfig::startup_scan() {
    std::cout << "[LocalModelsConfig] Running startup scan for " << models_.size() << " models" << std::endl;
    for (auto& model : models_) {
        // A persisted "downloading" state cannot outlive the process that wrote it
        FilesystemReconciler::reconcile(model);
    }
    touch();
}

bool LocalModelsConfig::save() {
    json models = json::array();
    for (const auto& model : models_) {
        models.push_back(model_entry_to_json(model, true));
    }

    json doc;
    doc["version"] = version_;
    if (!last_updated_.empty()) {
        doc["last_updated"] = last_updated_;
    }
    doc["models"] = models;

    try {
        JsonUtils::save_to_file(doc, path_);
        return true;
    } catch (const FilesystemError& e) {
        std::cerr << "[LocalModelsConfig] Failed to save: " << e.what() << std::endl;
        return false;
    }
}

const ModelEntry* LocalModelsConfig::find(const std::string& id) const {
    for (const auto& model : models_) {
        if (model.id == id) {
            return &model;
        }
    }
    return nullptr;
}

ModelEntry* LocalModelsConfig::find(const std::string& id) {
    for (auto& model : models_) {
        if (model.id == id) {
            return &model;
        }
    }
    return nullptr;
}

void LocalModelsConfig::touch() {
    last_updated_ = utils::utc_timestamp();
}

bool LocalModelsConfig::set_model_state(const std::string& id, ModelState state) {
    ModelEntry* model = find(id);
    if (!model) {
        return false;
    }
    model->status.state = state;
    touch();
    save();
    return true;
}

bool LocalModelsConfig::mark_ready(const std::string& id) {
    ModelEntry* model = find(id);
    if (!model) {
        return false;
    }

    if (model->is_file_count_sensitive()) {
        FilesystemReconciler::reconcile(*model);
    } else {
        DiskUsage usage = FilesystemReconciler::measure(*model);
        model->status.state = ModelState::READY;
        model->status.downloaded_files = usage.entries;
        model->status.total_files = usage.entries;
        model->status.downloaded_bytes = usage.bytes;
        model->status.last_checked = utils::utc_timestamp();
    }
    model->status.error_message.clear();
    model->status.last_downloaded = utils::utc_timestamp();
    touch();
    save();
    return true;
}

bool LocalModelsConfig::mark_error(const std::string& id, const std::string& message) {
    ModelEntry* model = find(id);
    if (!model) {
        return false;
    }
    model->status.state = ModelState::ERROR;
    model->status.error_message = message;
    touch();
    save();
    return true;
}

bool LocalModelsConfig::refresh_model(const std::string& id) {
    ModelEntry* model = find(id);
    if (!model) {
        return false;
    }
    FilesystemReconciler::reconcile(*model);
    touch();
    save();
    return true;
}

bool LocalModelsConfig::remove_model_files(const std::string& id) {
    ModelEntry* model = find(id);
    if (!model) {
        return false;
    }

    std::string dir = model->storage.expanded_path();
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        std::cerr << "[LocalModelsConfig] Failed to remove " << dir << ": " << ec.message() << std::endl;
    } else {
        std::cout << "[LocalModelsConfig] Removed " << dir << std::endl;
    }

    model->status = ModelStatusInfo();
    for (auto& file : model->files) {
        file.downloaded = false;
    }
    FilesystemReconciler::reconcile(*model);
    touch();
    save();

    return !fs::exists(dir, ec);
}

void LocalModelsConfig::on_completed(const std::string& model_id) {
    if (!mark_ready(model_id)) {
        std::cerr << "[LocalModelsConfig] Completed download for unknown model " << model_id << std::endl;
    }
}

void LocalModelsConfig::on_failed(const std::string& model_id, const std::string& error_message) {
    if (!mark_error(model_id, error_message)) {
        std::cerr << "[LocalModelsConfig] Failed download for unknown model " << model_id << std::endl;
    }
}

void LocalModelsConfig::on_cancelled(const std::string& model_id) {
    refresh_model(model_id);
}

} // namespace modelhub
