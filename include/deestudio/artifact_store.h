/**
 * @file artifact_store.h
 * @brief Persistence of generated images
 *
 * Each saved image gets a random 128-bit identifier (UUID v4 text form), is
 * written as <family>_<mode>_<id>.png into the output directory and is
 * returned both inline (data URL) and as a retrievable URL.
 */

#pragma once

#include "model_types.h"
#include "outcome.h"
#include <atomic>
#include <filesystem>
#include <string>

namespace deestudio {

/**
 * @struct ArtifactStoreConfig
 */
struct ArtifactStoreConfig {
    std::filesystem::path output_dir = "outputs";
    std::string url_prefix = "/images";
};

/**
 * @class ArtifactStore
 * @brief Thread-safe image persistence
 */
class ArtifactStore {
public:
    explicit ArtifactStore(ArtifactStoreConfig config);

    /**
     * @brief Encode, persist and describe one image
     * @return Artifact, or GenerationFailure if encoding or writing failed
     */
    Outcome<Artifact> save(const Image& image, ModelFamily family, GenerationMode mode);

    /**
     * @brief New UUID v4 ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx")
     */
    static std::string generate_id();

    const std::filesystem::path& output_dir() const { return config_.output_dir; }
    const std::string& url_prefix() const { return config_.url_prefix; }
    uint64_t saved_count() const { return saved_count_.load(); }

private:
    ArtifactStoreConfig config_;
    std::atomic<uint64_t> saved_count_{0};
};

} // namespace deestudio
