#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace modelhub::utils {

using json = nlohmann::json;

class JsonUtils {
public:
    // Parse a JSON string, throws modelhub::FormatError on malformed input
    static json parse(const std::string& text);

    // Read and parse a file, throws on I/O or parse errors
    static json load_from_file(const std::string& path);

    // Pretty-print to a file, creating parent directories
    static void save_to_file(const json& data, const std::string& path);

    template <typename T>
    static T get_or_default(const json& obj, const std::string& key, const T& default_value) {
        if (obj.is_object() && obj.contains(key) && !obj[key].is_null()) {
            try {
                return obj[key].get<T>();
            } catch (const json::exception&) {
                return default_value;
            }
        }
        return default_value;
    }
};

} // namespace modelhub::utils
