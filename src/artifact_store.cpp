/**
 * @file artifact_store.cpp
 * @brief ArtifactStore implementation
 */

#include "deestudio/artifact_store.h"
#include "deestudio/image_codec.h"
#include <fstream>
#include <iostream>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace deestudio {

ArtifactStore::ArtifactStore(ArtifactStoreConfig config)
    : config_(std::move(config))
{
    while (config_.url_prefix.size() > 1 && config_.url_prefix.back() == '/') {
        config_.url_prefix.pop_back();
    }
}

std::string ArtifactStore::generate_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    uint64_t hi = gen();
    uint64_t lo = gen();

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string id;
    id.reserve(36);
    for (int i = 15; i >= 0; --i) {
        id += hex[(hi >> (i * 4)) & 0xF];
        if (i == 8 || i == 4) id += '-';
    }
    id += '-';
    for (int i = 15; i >= 0; --i) {
        id += hex[(lo >> (i * 4)) & 0xF];
        if (i == 12) id += '-';
    }
    return id;
}

Outcome<Artifact> ArtifactStore::save(const Image& image, ModelFamily family, GenerationMode mode) {
    std::vector<uint8_t> png = encode_png(image);
    if (png.empty()) {
        return Outcome<Artifact>::fail(ErrorKind::GenerationFailure, "Failed to encode image as PNG");
    }

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec || !fs::is_directory(config_.output_dir)) {
        std::cerr << "[ArtifactStore] Cannot create output directory " << config_.output_dir
                  << ": " << ec.message() << std::endl;
        return Outcome<Artifact>::fail(ErrorKind::GenerationFailure,
            "Cannot create output directory: " + config_.output_dir.string());
    }

    Artifact artifact;
    artifact.id = generate_id();
    artifact.filename = family_to_string(family) + "_" + mode_to_string(mode) + "_" + artifact.id + ".png";

    fs::path target = config_.output_dir / artifact.filename;
    fs::path temp_path = target;
    temp_path += ".tmp";

    // Write to temp file first, then rename into place
    {
        std::ofstream file(temp_path, std::ios::binary);
        if (!file) {
            return Outcome<Artifact>::fail(ErrorKind::GenerationFailure,
                "Failed to create " + temp_path.string());
        }
        file.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp_path, ec);
            return Outcome<Artifact>::fail(ErrorKind::GenerationFailure,
                "Write failed: " + temp_path.string());
        }
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        return Outcome<Artifact>::fail(ErrorKind::GenerationFailure,
            "Rename failed: " + reason);
    }

    artifact.path = target.string();
    artifact.url = config_.url_prefix + "/" + artifact.filename;
    artifact.data_url = to_data_url(png);
    artifact.png = std::move(png);
    artifact.size = image.size();

    saved_count_++;
    std::cout << "[ArtifactStore] Saved " << artifact.filename << std::endl;
    return Outcome<Artifact>::ok(std::move(artifact));
}

} // namespace deestudio
