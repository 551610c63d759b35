/**
 * @file request_codec.cpp
 * @brief Route-layer request parsing and response building
 */

#include "deestudio/request_codec.h"
#include "deestudio/image_codec.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace deestudio {

namespace {

const char* guidance_field(const FamilyTraits& traits) {
    return traits.guidance_kind == GuidanceKind::CFG ? "cfg_scale" : "guidance";
}

// Seeds of -1 (or null) request a random seed
void apply_seed(GenerationRequest& request, int64_t seed) {
    if (seed == -1) {
        request.seed.reset();
    } else {
        request.seed = seed;
    }
}

// Integer fields must be JSON integers: 1024.5 or "1024" is rejected, not truncated
Outcome<std::optional<int64_t>> integer_field(const json& body, const char* key) {
    using Result = Outcome<std::optional<int64_t>>;
    if (!body.contains(key) || body[key].is_null()) {
        return Result::ok(std::nullopt);
    }
    const json& value = body[key];
    if (!value.is_number_integer()) {
        return Result::fail(ErrorKind::ValidationError, std::string("Field '") + key + "' must be an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Result::fail(ErrorKind::ValidationError, std::string("Field '") + key + "' is out of range");
    }
    return Result::ok(value.get<int64_t>());
}

Status assign_int(const json& body, const char* key, int& target) {
    auto field = integer_field(body, key);
    if (!field) {
        return Status::fail(field.error());
    }
    if (field.value()) {
        int64_t v = *field.value();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return Status::fail(ErrorKind::ValidationError, std::string("Field '") + key + "' is out of range");
        }
        target = static_cast<int>(v);
    }
    return Status::ok();
}

bool parse_bool_text(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

GenerationRequest defaults_for(ModelFamily family, GenerationMode mode) {
    const FamilyTraits& traits = family_traits(family);
    GenerationRequest request;
    request.family = family;
    request.mode = mode;
    request.size = traits.default_size;
    request.steps = traits.default_steps;
    request.guidance = traits.default_guidance;
    request.num_images = 1;
    return request;
}

} // namespace

Outcome<GenerationRequest> parse_generation_json(ModelFamily family, GenerationMode mode,
                                                 const json& body) {
    using Result = Outcome<GenerationRequest>;
    if (!body.is_object()) {
        return Result::fail(ErrorKind::ValidationError, "Request body must be a JSON object");
    }

    GenerationRequest request = defaults_for(family, mode);

    try {
        if (!body.contains("prompt") || !body["prompt"].is_string()) {
            return Result::fail(ErrorKind::ValidationError, "Missing 'prompt' in request body");
        }
        request.prompt = body["prompt"].get<std::string>();

        if (body.contains("negative_prompt") && body["negative_prompt"].is_string()) {
            request.negative_prompt = body["negative_prompt"].get<std::string>();
        }

        for (auto target : {std::make_pair("width", &request.size.width),
                            std::make_pair("height", &request.size.height),
                            std::make_pair("num_images", &request.num_images),
                            std::make_pair("steps", &request.steps)}) {
            Status assigned = assign_int(body, target.first, *target.second);
            if (!assigned) {
                return Result::fail(assigned.error());
            }
        }
        request.tiled = body.value("tiled", false);

        for (const char* key : {"guidance", "cfg_scale", "guidance_scale"}) {
            if (body.contains(key) && !body[key].is_null()) {
                request.guidance = body[key].get<float>();
                break;
            }
        }

        auto seed = integer_field(body, "seed");
        if (!seed) {
            return Result::fail(seed.error());
        }
        if (seed.value()) {
            apply_seed(request, *seed.value());
        }

        for (const char* key : {"denoising_strength", "strength"}) {
            if (body.contains(key) && !body[key].is_null()) {
                request.denoising_strength = body[key].get<float>();
                break;
            }
        }
    } catch (const json::exception& e) {
        return Result::fail(ErrorKind::ValidationError, std::string("Invalid request field: ") + e.what());
    }

    if (mode == GenerationMode::IMAGE_TO_IMAGE) {
        if (!body.contains("image") || !body["image"].is_string()) {
            return Result::fail(ErrorKind::ValidationError, "Missing 'image' (base64) in request body");
        }
        std::vector<uint8_t> bytes = decode_data_url(body["image"].get<std::string>());
        if (bytes.empty()) {
            return Result::fail(ErrorKind::ValidationError, "Failed to decode base64 image data");
        }
        auto decoded = decode_image(bytes);
        if (!decoded) {
            return Result::fail(decoded.error());
        }
        request.input_image = decoded.take();
    }

    return Result::ok(std::move(request));
}

Outcome<GenerationRequest> parse_generation_form(ModelFamily family,
                                                 const std::map<std::string, std::string>& fields,
                                                 const std::vector<uint8_t>& image_bytes) {
    using Result = Outcome<GenerationRequest>;
    GenerationRequest request = defaults_for(family, GenerationMode::IMAGE_TO_IMAGE);

    auto field = [&fields](const char* key) -> const std::string* {
        auto it = fields.find(key);
        if (it == fields.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    };

    const std::string* prompt = field("prompt");
    if (!prompt) {
        return Result::fail(ErrorKind::ValidationError, "Missing 'prompt' form field");
    }
    request.prompt = *prompt;

    auto negative = fields.find("negative_prompt");
    if (negative != fields.end()) {
        request.negative_prompt = negative->second;
    }

    // Name of the field being converted, for the error message
    std::string current_key;
    auto numeric = [&](const char* key) -> const std::string* {
        current_key = key;
        return field(key);
    };

    // The whole field must convert: "1024.7" is not an integer
    auto to_int = [](const std::string& text) {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    };
    auto to_float = [](const std::string& text) {
        size_t used = 0;
        float v = std::stof(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    };

    try {
        if (const std::string* v = numeric("width")) request.size.width = to_int(*v);
        if (const std::string* v = numeric("height")) request.size.height = to_int(*v);
        if (const std::string* v = numeric("num_images")) request.num_images = to_int(*v);
        if (const std::string* v = numeric("steps")) request.steps = to_int(*v);
        for (const char* key : {"guidance", "cfg_scale", "guidance_scale"}) {
            if (const std::string* v = numeric(key)) {
                request.guidance = to_float(*v);
                break;
            }
        }
        for (const char* key : {"denoising_strength", "strength"}) {
            if (const std::string* v = numeric(key)) {
                request.denoising_strength = to_float(*v);
                break;
            }
        }
        if (const std::string* v = numeric("seed")) {
            size_t used = 0;
            long long seed = std::stoll(*v, &used);
            if (used != v->size()) throw std::invalid_argument(*v);
            apply_seed(request, seed);
        }
        if (const std::string* v = field("tiled")) request.tiled = parse_bool_text(*v);
    } catch (const std::invalid_argument&) {
        return Result::fail(ErrorKind::ValidationError, "Form field '" + current_key + "' is not a number");
    } catch (const std::out_of_range&) {
        return Result::fail(ErrorKind::ValidationError, "Form field '" + current_key + "' is out of range");
    }

    if (image_bytes.empty()) {
        return Result::fail(ErrorKind::ValidationError, "Missing 'image' file upload");
    }
    auto decoded = decode_image(image_bytes);
    if (!decoded) {
        return Result::fail(decoded.error());
    }
    request.input_image = decoded.take();

    return Result::ok(std::move(request));
}

json result_to_json(const GenerationResult& result) {
    json images = json::array();
    json image_urls = json::array();
    json ids = json::array();
    for (const auto& artifact : result.artifacts) {
        images.push_back(artifact.data_url);
        image_urls.push_back(artifact.url);
        ids.push_back(artifact.id);
    }

    return {
        {"images", images},
        {"image_urls", image_urls},
        {"ids", ids},
        {"seed", result.seed},
        {"seeds", result.seeds},
        {"generation_time", result.generation_time_s},
        {"model", family_to_string(result.family)},
        {"mode", mode_to_string(result.mode)},
        {"cache_hit", result.cache_hit}
    };
}

json error_to_json(const Error& error) {
    json body = {
        {"message", error.message},
        {"type", error_kind_to_string(error.kind)},
        {"code", error.http_status}
    };
    if (error.kind == ErrorKind::GenerationFailure || error.kind == ErrorKind::Cancelled) {
        body["images_completed"] = error.images_completed;
    }
    if (error.kind == ErrorKind::ResourceExhausted) {
        body["bytes_still_held"] = error.bytes_still_held;
    }
    return {{"error", body}};
}

json capabilities_to_json(const std::vector<FamilyCapability>& capabilities) {
    json models = json::array();
    bool flux_available = false;

    for (const auto& capability : capabilities) {
        const FamilyTraits& traits = *capability.traits;
        if (traits.family == ModelFamily::FLUX && capability.available) {
            flux_available = true;
        }

        json parameters = {
            {"prompt", {{"type", "text"}, {"label", "Prompt"}, {"required", true}}},
            {"width", {
                {"type", "number"}, {"label", "Width"},
                {"min", traits.min_size}, {"max", traits.max_size},
                {"default", traits.default_size.width}, {"step", traits.size_multiple}
            }},
            {"height", {
                {"type", "number"}, {"label", "Height"},
                {"min", traits.min_size}, {"max", traits.max_size},
                {"default", traits.default_size.height}, {"step", traits.size_multiple}
            }},
            {"num_images", {
                {"type", "number"}, {"label", "Number of Images"},
                {"min", kMinImageCount}, {"max", kMaxImageCount}, {"default", 1}
            }},
            {"steps", {
                {"type", "slider"}, {"label", "Steps"},
                {"min", traits.min_steps}, {"max", traits.max_steps}, {"default", traits.default_steps}
            }},
            {guidance_field(traits), {
                {"type", "slider"},
                {"label", traits.guidance_kind == GuidanceKind::CFG ? "CFG Scale" : "Guidance"},
                {"min", traits.min_guidance}, {"max", traits.max_guidance},
                {"default", traits.default_guidance}, {"step", traits.guidance_step}
            }},
            {"seed", {{"type", "number"}, {"label", "Seed"}, {"required", false}}},
            {"denoising_strength", {
                {"type", "slider"}, {"label", "Denoising Strength"},
                {"min", 0.0}, {"max", 1.0}, {"default", 0.75}, {"step", 0.05}, {"img2img_only", true}
            }},
            {"tiled", {{"type", "boolean"}, {"label", "Tiled Generation"}, {"default", false}, {"advanced", true}}}
        };
        if (traits.uses_negative_prompt) {
            parameters["negative_prompt"] = {
                {"type", "text"}, {"label", "Negative Prompt"}, {"required", false},
                {"default", capability.default_negative_prompt}
            };
        }

        models.push_back({
            {"id", traits.id},
            {"name", traits.display_name},
            {"description", traits.description},
            {"available", capability.available},
            {"overlay_available", capability.overlay_available},
            {"features", capability.features},
            {"parameters", parameters}
        });
    }

    return {
        {"models", models},
        {"default_model", flux_available ? "flux" : "sdxl"}
    };
}

json slot_status_to_json(const SlotStatus& status) {
    return {
        {"state", slot_state_to_string(status.state)},
        {"family", status.family ? json(family_to_string(*status.family)) : json(nullptr)},
        {"generation", status.generation},
        {"waiting", status.waiting},
        {"offload_enabled", status.offload_enabled},
        {"overlay_applied", status.overlay_applied},
        {"stats", {
            {"loads", status.stats.loads},
            {"load_failures", status.stats.load_failures},
            {"evictions", status.stats.evictions},
            {"unloads", status.stats.unloads},
            {"hits", status.stats.hits},
            {"admissions_denied", status.stats.admissions_denied}
        }}
    };
}

json guard_stats_to_json(const GuardStats& stats, uint64_t threshold_bytes) {
    return {
        {"threshold_bytes", threshold_bytes},
        {"last_measured_bytes", stats.last_measured_bytes},
        {"last_measured", format_gb(stats.last_measured_bytes)},
        {"reclaims", stats.reclaims},
        {"admissions", stats.admissions},
        {"denials", stats.denials}
    };
}

} // namespace deestudio
