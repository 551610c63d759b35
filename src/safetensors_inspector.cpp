/**
 * @file safetensors_inspector.cpp
 * @brief safetensors header parsing with nlohmann/json
 */

#include "deestudio/safetensors_inspector.h"
#include "nlohmann/json.hpp"
#include <fstream>

using json = nlohmann::json;

namespace deestudio {

// Module name fragments per family. Diffusers, kohya and original key
// conventions all contain one of these.
static const std::vector<std::string>& family_markers(ModelFamily family) {
    static const std::vector<std::string> sdxl = {
        "input_blocks", "output_blocks", "middle_block",
        "down_blocks", "up_blocks", "mid_block",
        "lora_te1_", "lora_te2_"
    };
    static const std::vector<std::string> flux = {
        "double_blocks", "single_blocks",
        "single_transformer_blocks", "transformer.transformer_blocks"
    };
    return family == ModelFamily::FLUX ? flux : sdxl;
}

Outcome<SafetensorsHeader> read_safetensors_header(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
            "Cannot open overlay weights: " + path.string());
    }

    unsigned char len_bytes[8] = {};
    if (!in.read(reinterpret_cast<char*>(len_bytes), sizeof(len_bytes))) {
        return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
            "Overlay weights truncated: " + path.string());
    }

    uint64_t header_len = 0;
    for (int i = 7; i >= 0; --i) {
        header_len = (header_len << 8) | len_bytes[i];
    }
    if (header_len == 0 || header_len > kMaxSafetensorsHeaderBytes) {
        return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
            "Invalid safetensors header length (" + std::to_string(header_len) + "): " + path.string());
    }

    std::string header_text(static_cast<size_t>(header_len), '\0');
    if (!in.read(&header_text[0], static_cast<std::streamsize>(header_len))) {
        return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
            "Overlay header truncated: " + path.string());
    }

    SafetensorsHeader header;
    try {
        json root = json::parse(header_text);
        if (!root.is_object()) {
            return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
                "Overlay header is not a JSON object: " + path.string());
        }

        for (auto it = root.begin(); it != root.end(); ++it) {
            if (it.key() == "__metadata__") {
                if (it.value().is_object()) {
                    for (auto m = it.value().begin(); m != it.value().end(); ++m) {
                        if (m.value().is_string()) {
                            header.metadata[m.key()] = m.value().get<std::string>();
                        }
                    }
                }
                continue;
            }

            const json& entry = it.value();
            TensorEntry tensor;
            tensor.name = it.key();
            tensor.dtype = entry.value("dtype", "");
            if (entry.contains("shape") && entry["shape"].is_array()) {
                tensor.shape = entry["shape"].get<std::vector<int64_t>>();
            }
            header.tensors.push_back(std::move(tensor));
        }
    } catch (const json::exception& e) {
        return Outcome<SafetensorsHeader>::fail(ErrorKind::OverlayLoadFailure,
            std::string("Overlay header parse error: ") + e.what());
    }

    return Outcome<SafetensorsHeader>::ok(std::move(header));
}

size_t count_family_tensors(const SafetensorsHeader& header, ModelFamily family) {
    const auto& markers = family_markers(family);
    size_t count = 0;
    for (const auto& tensor : header.tensors) {
        for (const auto& marker : markers) {
            if (tensor.name.find(marker) != std::string::npos) {
                count++;
                break;
            }
        }
    }
    return count;
}

Status check_overlay_compatibility(const SafetensorsHeader& header, ModelFamily family) {
    if (header.tensors.empty()) {
        return Status::fail(ErrorKind::OverlayLoadFailure, "Overlay weights contain no tensors");
    }

    size_t own = count_family_tensors(header, family);
    if (own == 0) {
        return Status::fail(ErrorKind::OverlayLoadFailure,
            "Overlay weights do not target any " + family_to_string(family) + " module");
    }

    for (ModelFamily other : all_families()) {
        if (other == family) continue;
        size_t foreign = count_family_tensors(header, other);
        if (foreign > 0) {
            return Status::fail(ErrorKind::OverlayLoadFailure,
                "Overlay weights target " + family_to_string(other) + " modules (" +
                std::to_string(foreign) + " tensors), incompatible with " + family_to_string(family));
        }
    }
    return Status::ok();
}

} // namespace deestudio
