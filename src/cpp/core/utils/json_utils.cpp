#include <modelhub/utils/json_utils.h>
#include <modelhub/error_types.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace modelhub::utils {

json JsonUtils::parse(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Invalid JSON: ") + e.what());
    }
}

json JsonUtils::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FilesystemError("Could not open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parse(buffer.str());
    } catch (const FormatError& e) {
        throw FormatError(path + ": " + e.what());
    }
}

void JsonUtils::save_to_file(const json& data, const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw FilesystemError("Could not create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw FilesystemError("Could not open file for writing: " + path);
    }

    file << data.dump(2) << std::endl;
    if (!file.good()) {
        throw FilesystemError("Failed to write file: " + path);
    }
}

} // namespace modelhub::utils
