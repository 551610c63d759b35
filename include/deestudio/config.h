/**
 * @file config.h
 * @brief DeeStudio runtime configuration
 *
 * Precedence (lowest to highest): built-in defaults, JSON config file,
 * environment variables, command-line flags.
 *
 * Config file layout (every key may also appear at the top level):
 * {
 *   "server":  { "host", "port", "cors_enabled", "queue_timeout_ms", "thread_pool_size",
 *                "max_queued_requests", "ui_dir" },
 *   "paths":   { "models_root", "output_dir", "images_url_prefix", "overlay_path" },
 *   "runtime": { "overlay_strength", "admission_threshold_mb", "flux_offload", "sdxl_offload",
 *                "default_negative_prompt", "n_threads", "flash_attn", "sd_log_level" }
 * }
 */

#pragma once

#include "artifact_store.h"
#include "generation_orchestrator.h"
#include "model_registry.h"
#include "pipeline_cache.h"
#include "sd_pipeline_loader.h"
#include <cstdint>
#include <string>

namespace deestudio {

/**
 * @struct StudioConfig
 * @brief All tunables of the server and CLI
 */
struct StudioConfig {
    // server
    std::string host = "127.0.0.1";
    int port = 8000;
    bool cors_enabled = true;
    int queue_timeout_ms = 300000;
    int thread_pool_size = 8;
    int max_queued_requests = -1;            ///< Waiters on the accelerator; -1 = thread_pool_size - 2
    std::string ui_dir;                      ///< Static UI bundle served at "/" when set

    // paths
    std::string models_root = "models";
    std::string output_dir = "outputs/images";
    std::string images_url_prefix = "/images";
    std::string overlay_path = "lora/flux/overlay.safetensors";

    // runtime
    float overlay_strength = 1.0f;
    int admission_threshold_mb = 1024;
    bool flux_offload = true;
    bool sdxl_offload = false;
    std::string default_negative_prompt = kDefaultNegativePrompt;
    int n_threads = -1;
    bool flash_attn = true;
    std::string sd_log_level = "info";

    RegistryConfig registry_config() const;
    CacheOptions cache_options() const;
    ArtifactStoreConfig artifact_config() const;
    OrchestratorOptions orchestrator_options() const;
    SdLoaderConfig loader_config() const;
    uint64_t admission_threshold_bytes() const;
    int max_queued_waiters() const;
};

/**
 * @brief DEESTUDIO_CONFIG_PATH, else $XDG_CONFIG_HOME/deestudio/config.json,
 *        else ~/.config/deestudio/config.json
 */
std::string default_config_path();

/**
 * @brief Merge a JSON config file into config
 * @return false if the file exists but could not be read/parsed (error set);
 *         a missing file returns false with an empty error
 */
bool load_config_file(const std::string& path, StudioConfig& config, std::string& error);

/**
 * @brief Apply DEESTUDIO_MODELS_ROOT and DEESTUDIO_OUTPUT_DIR
 */
void apply_env_overrides(StudioConfig& config);

/**
 * @brief Range checks on merged values
 * @return Empty string when valid, otherwise the first problem found
 */
std::string validate_config(const StudioConfig& config);

} // namespace deestudio
