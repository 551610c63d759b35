/**
 * @file safetensors_inspector.h
 * @brief Header-only reads of .safetensors files
 *
 * A safetensors file starts with a little-endian u64 header length followed
 * by a JSON object mapping tensor names to {dtype, shape, data_offsets}.
 * Reading just the header is enough to decide which sub-module an overlay
 * file targets, without touching the tensor data.
 */

#pragma once

#include "model_types.h"
#include "outcome.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace deestudio {

/**
 * @struct TensorEntry
 * @brief One tensor described in the header
 */
struct TensorEntry {
    std::string name;
    std::string dtype;
    std::vector<int64_t> shape;
};

/**
 * @struct SafetensorsHeader
 * @brief Parsed header of a safetensors file
 */
struct SafetensorsHeader {
    std::vector<TensorEntry> tensors;
    std::map<std::string, std::string> metadata;   ///< "__metadata__" string pairs
};

/// Refuse headers larger than this (corrupt or not a safetensors file)
constexpr uint64_t kMaxSafetensorsHeaderBytes = 100ULL * 1024 * 1024;

/**
 * @brief Parse the header of a safetensors file
 * @return Header, or OverlayLoadFailure if unreadable or malformed
 */
Outcome<SafetensorsHeader> read_safetensors_header(const std::filesystem::path& path);

/**
 * @brief Count tensors whose names address the family's denoiser/text-encoder modules
 */
size_t count_family_tensors(const SafetensorsHeader& header, ModelFamily family);

/**
 * @brief Check that overlay tensor names inject into the given family
 *
 * Compatible when at least one tensor addresses the family's modules and
 * none address another family's modules.
 */
Status check_overlay_compatibility(const SafetensorsHeader& header, ModelFamily family);

} // namespace deestudio
