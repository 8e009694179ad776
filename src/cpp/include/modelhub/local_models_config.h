#pragma once

#include <string>
#include <vector>
#include "model_types.h"
#include "status_poller.h"

namespace modelhub {

constexpr const char* LOCAL_CONFIG_VERSION = "1.0.0";

// Persisted "installed models" document ({version, last_updated, models}).
// Every mutation rewrites the file. Owned by the control thread.
class LocalModelsConfig : public StatusSink {
public:
    explicit LocalModelsConfig(std::string path);

    // Read the document, falling back to defaults when it is missing or
    // malformed, append missing default entries, reconcile every entry from
    // disk and save.
    void load(const std::vector<ModelEntry>& defaults);

    // Returns false (after logging) when the document could not be written
    bool save();

    void startup_scan();

    const std::vector<ModelEntry>& models() const { return models_; }
    const ModelEntry* find(const std::string& id) const;
    ModelEntry* find(const std::string& id);

    bool set_model_state(const std::string& id, ModelState state);
    bool mark_ready(const std::string& id);
    bool mark_error(const std::string& id, const std::string& message);
    bool refresh_model(const std::string& id);

    // Delete the storage directory and reconcile. True when it is gone.
    bool remove_model_files(const std::string& id);

    void on_completed(const std::string& model_id) override;
    void on_failed(const std::string& model_id, const std::string& error_message) override;
    void on_cancelled(const std::string& model_id) override;

    const std::string& path() const { return path_; }
    const std::string& version() const { return version_; }
    const std::string& last_updated() const { return last_updated_; }

    static std::string default_path();

private:
    void merge_with_defaults(const std::vector<ModelEntry>& defaults);
    void touch();

    std::string path_;
    std::string version_ = LOCAL_CONFIG_VERSION;
    std::string last_updated_;
    std::vector<ModelEntry> models_;
};

} // namespace modelhub
