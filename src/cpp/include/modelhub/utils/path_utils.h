#pragma once

#include <map>
#include <string>

namespace modelhub::utils {

// User home directory (HOME, or USERPROFILE on Windows); empty if unknown
std::string get_home_dir();

// Expand a leading "~/" to the home directory
std::string expand_home(const std::string& path);

// Per-user state directory: $MODELHUB_CONFIG_DIR or ~/.modelhub
std::string get_config_dir();

// Bearer token for the model hubs: $HF_TOKEN, then ~/.cache/huggingface/token,
// then ~/.huggingface/hub/token. Empty when none is configured.
std::string read_auth_token();

// {"Authorization": "Bearer <token>"} when a token is configured, else empty
std::map<std::string, std::string> auth_headers();

// UTC timestamp in RFC 3339 form, e.g. "2026-10-19T08:30:00Z"
std::string utc_timestamp();

} // namespace modelhub::utils
