#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>
#include "model_types.h"

namespace modelhub {

constexpr const char* DEFAULT_REGISTRY_URL = "https://registry.ominix.ai/models_registry.json";

// Text of the catalog compiled into the binary
const std::string& bundled_catalog_text();

// Owns the merged model catalog: the bundled defaults with the user override
// (if any) layered on top. Readers get copies.
class CatalogStore {
public:
    CatalogStore();
    CatalogStore(std::string bundled_text, std::string override_path, std::string registry_url);

    // Parse the bundled catalog and merge the override. Throws FormatError if
    // the bundled text is invalid; a broken override is logged and skipped.
    const Catalog& load();

    // Replace entries of base with same-id entries of incoming, append the rest
    static void merge(Catalog& base, const Catalog& incoming);

    // Fetch the remote catalog in the background and write it to the override
    // path. Never throws; the future tells whether the override was written.
    // Dropping the future does not wait for the fetch.
    std::future<bool> refresh_async() const;

    void save_override(const Catalog& catalog) const;

    const Catalog& catalog() const { return catalog_; }
    std::optional<ModelEntry> get(const std::string& id) const;
    std::vector<ModelEntry> by_category(ModelCategory category) const;
    std::vector<ModelEntry> search(const std::string& query) const;

    const std::string& override_path() const { return override_path_; }
    const std::string& registry_url() const { return registry_url_; }

    static std::string default_override_path();

private:
    std::string bundled_text_;
    std::string override_path_;
    std::string registry_url_;
    Catalog catalog_;
};

} // namespace modelhub
