#include <modelhub/utils/path_utils.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace modelhub::utils {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
#ifdef _WIN32
    const char* profile = std::getenv("USERPROFILE");
    if (profile && *profile) {
        return profile;
    }
#endif
    return "";
}

std::string expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.rfind("~/", 0) == 0) {
        std::string home = get_home_dir();
        if (!home.empty()) {
            return (fs::path(home) / path.substr(2)).string();
        }
    }
    return path;
}

std::string get_config_dir() {
    const char* env_dir = std::getenv("MODELHUB_CONFIG_DIR");
    if (env_dir && *env_dir) {
        return expand_home(env_dir);
    }
    return expand_home("~/.modelhub");
}

static std::string read_first_line(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    size_t end = line.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

std::string read_auth_token() {
    const char* env_token = std::getenv("HF_TOKEN");
    if (env_token && *env_token) {
        return env_token;
    }

    std::string home = get_home_dir();
    if (home.empty()) {
        return "";
    }

    for (const char* rel : {".cache/huggingface/token", ".huggingface/hub/token"}) {
        std::string token = read_first_line(fs::path(home) / rel);
        if (!token.empty()) {
            return token;
        }
    }
    return "";
}

std::map<std::string, std::string> auth_headers() {
    std::map<std::string, std::string> headers;
    std::string token = read_auth_token();
    if (!token.empty()) {
        headers["Authorization"] = "Bearer " + token;
    }
    return headers;
}

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &now);
#else
    gmtime_r(&now, &tm_utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

} // namespace modelhub::utils
