/**
 * @file request_codec.h
 * @brief JSON/form <-> request and result conversion for the route layer
 *
 * Request fields (JSON body or multipart form fields):
 *   prompt, negative_prompt, width, height, num_images, steps,
 *   guidance (alias cfg_scale, guidance_scale), seed (-1 or null = random),
 *   tiled, denoising_strength (alias strength), image (base64/data URL, JSON only)
 *
 * Missing numeric fields take the family defaults.
 */

#pragma once

#include "generation_orchestrator.h"
#include "model_types.h"
#include "outcome.h"
#include "pipeline_cache.h"
#include "resource_guard.h"
#include "nlohmann/json.hpp"
#include <map>
#include <string>
#include <vector>

namespace deestudio {

using json = nlohmann::ordered_json;

/**
 * @brief Parse a JSON generate/transform body
 *
 * IMAGE_TO_IMAGE requires "image" as base64 or data URL.
 */
Outcome<GenerationRequest> parse_generation_json(ModelFamily family, GenerationMode mode,
                                                 const json& body);

/**
 * @brief Parse multipart form fields plus the uploaded image bytes
 */
Outcome<GenerationRequest> parse_generation_form(ModelFamily family,
                                                 const std::map<std::string, std::string>& fields,
                                                 const std::vector<uint8_t>& image_bytes);

/**
 * @brief {images, image_urls, ids, seed, seeds, generation_time, ...}
 */
json result_to_json(const GenerationResult& result);

/**
 * @brief {error: {message, type, code}} plus images_completed / bytes_still_held when set
 */
json error_to_json(const Error& error);

/**
 * @brief Family listing for GET /api/models/config
 */
json capabilities_to_json(const std::vector<FamilyCapability>& capabilities);

json slot_status_to_json(const SlotStatus& status);

json guard_stats_to_json(const GuardStats& stats, uint64_t threshold_bytes);

} // namespace deestudio
