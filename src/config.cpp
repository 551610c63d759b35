/**
 * @file config.cpp
 * @brief Configuration file and environment handling
 */

#include "deestudio/config.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

using json = nlohmann::json;

namespace deestudio {

static bool try_get_string(const json& root, const char* section, const char* key, std::string& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_string()) {
            out = section_obj[key].get<std::string>();
            return true;
        }
    }
    if (root.contains(key) && root[key].is_string()) {
        out = root[key].get<std::string>();
        return true;
    }
    return false;
}

static bool try_get_int(const json& root, const char* section, const char* key, int& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_number_integer()) {
            out = section_obj[key].get<int>();
            return true;
        }
    }
    if (root.contains(key) && root[key].is_number_integer()) {
        out = root[key].get<int>();
        return true;
    }
    return false;
}

static bool try_get_float(const json& root, const char* section, const char* key, float& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_number()) {
            out = section_obj[key].get<float>();
            return true;
        }
    }
    if (root.contains(key) && root[key].is_number()) {
        out = root[key].get<float>();
        return true;
    }
    return false;
}

static bool try_get_bool(const json& root, const char* section, const char* key, bool& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_boolean()) {
            out = section_obj[key].get<bool>();
            return true;
        }
    }
    if (root.contains(key) && root[key].is_boolean()) {
        out = root[key].get<bool>();
        return true;
    }
    return false;
}

std::string default_config_path() {
    const char* env_config = std::getenv("DEESTUDIO_CONFIG_PATH");
    if (env_config && std::strlen(env_config) > 0) {
        return std::string(env_config);
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && std::strlen(xdg) > 0) {
        return std::string(xdg) + "/deestudio/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/deestudio/config.json";
    }
    return "/tmp/deestudio/config.json";
}

bool load_config_file(const std::string& path, StudioConfig& config, std::string& error) {
    if (path.empty()) return false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        error = "Failed to open config file: " + path;
        return false;
    }

    json root;
    try {
        in >> root;
    } catch (const std::exception& e) {
        error = std::string("Failed to parse config file: ") + e.what();
        return false;
    }
    if (!root.is_object()) {
        error = "Config file is not a JSON object: " + path;
        return false;
    }

    std::string str_value;
    int int_value = 0;
    float float_value = 0.0f;
    bool bool_value = false;

    if (try_get_string(root, "server", "host", str_value) && !str_value.empty()) {
        config.host = str_value;
    }
    if (try_get_int(root, "server", "port", int_value) && int_value >= 1 && int_value <= 65535) {
        config.port = int_value;
    }
    if (try_get_bool(root, "server", "cors_enabled", bool_value)) {
        config.cors_enabled = bool_value;
    }
    if (try_get_int(root, "server", "queue_timeout_ms", int_value) && int_value >= 0) {
        config.queue_timeout_ms = int_value;
    }
    if (try_get_int(root, "server", "thread_pool_size", int_value) && int_value >= 1 && int_value <= 128) {
        config.thread_pool_size = int_value;
    }
    if (try_get_int(root, "server", "max_queued_requests", int_value) && int_value >= -1) {
        config.max_queued_requests = int_value;
    }
    if (try_get_string(root, "server", "ui_dir", str_value)) {
        config.ui_dir = str_value;
    }

    if (try_get_string(root, "paths", "models_root", str_value) && !str_value.empty()) {
        config.models_root = str_value;
    }
    if (try_get_string(root, "paths", "output_dir", str_value) && !str_value.empty()) {
        config.output_dir = str_value;
    }
    if (try_get_string(root, "paths", "images_url_prefix", str_value) && !str_value.empty()) {
        config.images_url_prefix = str_value;
    }
    if (try_get_string(root, "paths", "overlay_path", str_value)) {
        config.overlay_path = str_value;
    }

    if (try_get_float(root, "runtime", "overlay_strength", float_value)) {
        config.overlay_strength = float_value;
    }
    if (try_get_int(root, "runtime", "admission_threshold_mb", int_value) && int_value >= 0) {
        config.admission_threshold_mb = int_value;
    }
    if (try_get_bool(root, "runtime", "flux_offload", bool_value)) {
        config.flux_offload = bool_value;
    }
    if (try_get_bool(root, "runtime", "sdxl_offload", bool_value)) {
        config.sdxl_offload = bool_value;
    }
    if (try_get_string(root, "runtime", "default_negative_prompt", str_value)) {
        config.default_negative_prompt = str_value;
    }
    if (try_get_int(root, "runtime", "n_threads", int_value)) {
        config.n_threads = int_value;
    }
    if (try_get_bool(root, "runtime", "flash_attn", bool_value)) {
        config.flash_attn = bool_value;
    }
    if (try_get_string(root, "runtime", "sd_log_level", str_value) && !str_value.empty()) {
        std::string normalized = str_value;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);
        const std::vector<std::string> allowed = {"debug", "info", "warn", "error"};
        if (std::find(allowed.begin(), allowed.end(), normalized) != allowed.end()) {
            config.sd_log_level = normalized;
        }
    }

    return true;
}

void apply_env_overrides(StudioConfig& config) {
    const char* models_root = std::getenv("DEESTUDIO_MODELS_ROOT");
    if (models_root && std::strlen(models_root) > 0) {
        config.models_root = models_root;
    }
    const char* output_dir = std::getenv("DEESTUDIO_OUTPUT_DIR");
    if (output_dir && std::strlen(output_dir) > 0) {
        config.output_dir = output_dir;
    }
}

std::string validate_config(const StudioConfig& config) {
    if (config.port < 1 || config.port > 65535) {
        return "port must be between 1 and 65535";
    }
    if (config.thread_pool_size < 1) {
        return "thread_pool_size must be at least 1";
    }
    if (config.queue_timeout_ms < 0) {
        return "queue_timeout_ms must not be negative";
    }
    if (config.max_queued_requests < -1) {
        return "max_queued_requests must be -1 (derived) or at least 0";
    }
    if (config.max_queued_requests >= config.thread_pool_size - 1 && config.thread_pool_size > 1) {
        return "max_queued_requests must leave a worker free (at most thread_pool_size - 2)";
    }
    if (config.admission_threshold_mb < 0) {
        return "admission_threshold_mb must not be negative";
    }
    if (config.overlay_strength < 0.0f || config.overlay_strength > 2.0f) {
        return "overlay_strength must be between 0.0 and 2.0";
    }
    if (config.images_url_prefix.empty() || config.images_url_prefix[0] != '/') {
        return "images_url_prefix must start with '/'";
    }
    return std::string();
}

RegistryConfig StudioConfig::registry_config() const {
    RegistryConfig registry;
    registry.models_root = models_root;
    registry.overlay_path = overlay_path;
    if (overlay_path.empty()) {
        registry.overlay_family.reset();
    }
    registry.overlay_strength = overlay_strength;
    return registry;
}

CacheOptions StudioConfig::cache_options() const {
    CacheOptions options;
    options.queue_timeout = std::chrono::milliseconds(queue_timeout_ms);
    options.max_waiters = static_cast<size_t>(max_queued_waiters());
    options.offload_flux = flux_offload;
    options.offload_sdxl = sdxl_offload;
    return options;
}

ArtifactStoreConfig StudioConfig::artifact_config() const {
    ArtifactStoreConfig store;
    store.output_dir = output_dir;
    store.url_prefix = images_url_prefix;
    return store;
}

OrchestratorOptions StudioConfig::orchestrator_options() const {
    OrchestratorOptions options;
    options.default_negative_prompt = default_negative_prompt;
    return options;
}

SdLoaderConfig StudioConfig::loader_config() const {
    SdLoaderConfig loader;
    loader.n_threads = n_threads;
    loader.flash_attn = flash_attn;
    loader.min_log_level = sd_log_level;
    return loader;
}

int StudioConfig::max_queued_waiters() const {
    if (max_queued_requests >= 0) {
        return max_queued_requests;
    }
    // One worker runs the batch, one stays free for health and static files
    return std::max(0, thread_pool_size - 2);
}

uint64_t StudioConfig::admission_threshold_bytes() const {
    return static_cast<uint64_t>(admission_threshold_mb) * 1024 * 1024;
}

} // namespace deestudio
