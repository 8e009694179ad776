#include <modelhub/catalog_store.h>
#include <modelhub/error_types.h>
#include <modelhub/bundled_catalog.h>
#include <modelhub/utils/http_client.h>
#include <modelhub/utils/json_utils.h>
#include <modelhub/utils/path_utils.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace modelhub {

using utils::HttpClient;
using utils::JsonUtils;

static const long REFRESH_TIMEOUT_SECONDS = 10;

const std::string& bundled_catalog_text() {
    static const std::string text = resources::BUNDLED_CATALOG_JSON;
    return text;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

CatalogStore::CatalogStore()
    : CatalogStore(bundled_catalog_text(), default_override_path(), DEFAULT_REGISTRY_URL) {
}

CatalogStore::CatalogStore(std::string bundled_text, std::string override_path, std::string registry_url)
    : bundled_text_(std::move(bundled_text)),
      override_path_(std::move(override_path)),
      registry_url_(std::move(registry_url)) {
}

std::string CatalogStore::default_override_path() {
    return (fs::path(utils::get_config_dir()) / "models_registry.json").string();
}

const Catalog& CatalogStore::load() {
    Catalog catalog = catalog_from_json(JsonUtils::parse(bundled_text_));

    std::error_code ec;
    if (!override_path_.empty() && fs::exists(override_path_, ec)) {
        try {
            Catalog user_catalog = catalog_from_json(JsonUtils::load_from_file(override_path_));
            merge(catalog, user_catalog);
            std::cout << "[CatalogStore] Merged user override from " << override_path_ << std::endl;
        } catch (const AcquisitionError& e) {
            std::cerr << "[CatalogStore] Warning: Failed to parse user override "
                      << override_path_ << ": " << e.what() << std::endl;
        }
    }

    catalog_ = std::move(catalog);
    std::cout << "[CatalogStore] Loaded " << catalog_.models.size() << " models" << std::endl;
    return catalog_;
}

void CatalogStore::merge(Catalog& base, const Catalog& incoming) {
    for (const auto& entry : incoming.models) {
        auto it = std::find_if(base.models.begin(), base.models.end(),
                               [&](const ModelEntry& m) { return m.id == entry.id; });
        if (it != base.models.end()) {
            *it = entry;
        } else {
            base.models.push_back(entry);
        }
    }
    if (!incoming.version.empty()) {
        base.version = incoming.version;
    }
}

// Downloads the registry document and writes it to path. Runs off the control thread.
static bool fetch_registry(const std::string& url, const std::string& path) {
    utils::RequestOptions options;
    options.timeout_seconds = REFRESH_TIMEOUT_SECONDS;
    options.connect_timeout = REFRESH_TIMEOUT_SECONDS;

    auto response = HttpClient::get(url, {}, options);
    if (!response.error_message.empty()) {
        std::cout << "[CatalogStore] Refresh request failed: " << response.error_message << std::endl;
        return false;
    }
    if (!response.ok()) {
        std::cout << "[CatalogStore] Refresh: server returned " << response.status_code << std::endl;
        return false;
    }

    try {
        Catalog remote = catalog_from_json(JsonUtils::parse(response.body));
        JsonUtils::save_to_file(catalog_to_json(remote), path);
        std::cout << "[CatalogStore] Fetched " << remote.models.size()
                  << " models from " << url << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[CatalogStore] Refresh failed: " << e.what() << std::endl;
    }
    return false;
}

std::future<bool> CatalogStore::refresh_async() const {
    // Dropping the returned future must never block the caller
    auto result = std::make_shared<std::promise<bool>>();
    std::future<bool> future = result->get_future();

    try {
        std::thread([url = registry_url_, path = override_path_, result]() {
            result->set_value(fetch_registry(url, path));
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[CatalogStore] Could not start refresh: " << e.what() << std::endl;
        result->set_value(false);
    }
    return future;
}

void CatalogStore::save_override(const Catalog& catalog) const {
    JsonUtils::save_to_file(catalog_to_json(catalog), override_path_);
}

std::optional<ModelEntry> CatalogStore::get(const std::string& id) const {
    for (const auto& entry : catalog_.models) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

std::vector<ModelEntry> CatalogStore::by_category(ModelCategory category) const {
    std::vector<ModelEntry> result;
    for (const auto& entry : catalog_.models) {
        if (entry.category == category) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<ModelEntry> CatalogStore::search(const std::string& query) const {
    std::string q = to_lower(query);
    std::vector<ModelEntry> result;
    for (const auto& entry : catalog_.models) {
        bool match = to_lower(entry.name).find(q) != std::string::npos ||
                     to_lower(entry.description).find(q) != std::string::npos;
        if (!match) {
            match = std::any_of(entry.tags.begin(), entry.tags.end(), [&](const std::string& tag) {
                return to_lower(tag).find(q) != std::string::npos;
            });
        }
        if (match) {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace modelhub
