/**
 * @file test_request_codec.cpp
 * @brief JSON / multipart request parsing and response bodies
 */

#include <gtest/gtest.h>

#include "deestudio/image_codec.h"
#include "deestudio/request_codec.h"
#include "test_helpers.h"

using namespace deestudio;
using namespace deestudio::testing_support;

namespace {

std::string png_data_url(int width, int height) {
    return to_data_url(encode_png(solid_image(width, height, 90)));
}

}  // namespace

// =============================================================================
// JSON REQUESTS
// =============================================================================

TEST(ParseGenerationJson, MissingFieldsTakeFamilyDefaults) {
    auto parsed = parse_generation_json(ModelFamily::FLUX, GenerationMode::TEXT_TO_IMAGE,
                                        json{{"prompt", "a harbor"}});
    ASSERT_TRUE(parsed) << parsed.error().message;
    const GenerationRequest& req = parsed.value();
    EXPECT_EQ(req.family, ModelFamily::FLUX);
    EXPECT_EQ(req.prompt, "a harbor");
    EXPECT_EQ(req.size, (ImageSize{1024, 1024}));
    EXPECT_EQ(req.steps, 28);
    EXPECT_FLOAT_EQ(req.guidance, 3.5f);
    EXPECT_EQ(req.num_images, 1);
    EXPECT_FALSE(req.seed.has_value());
    EXPECT_FALSE(req.negative_prompt.has_value());
}

TEST(ParseGenerationJson, ReadsAllFields) {
    json body = {
        {"prompt", "a harbor"},
        {"negative_prompt", "fog"},
        {"width", 768},
        {"height", 512},
        {"num_images", 3},
        {"steps", 30},
        {"cfg_scale", 6.0},
        {"seed", 1234},
        {"tiled", true}
    };
    auto parsed = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE, body);
    ASSERT_TRUE(parsed);
    const GenerationRequest& req = parsed.value();
    EXPECT_EQ(req.negative_prompt, std::string("fog"));
    EXPECT_EQ(req.size, (ImageSize{768, 512}));
    EXPECT_EQ(req.num_images, 3);
    EXPECT_EQ(req.steps, 30);
    EXPECT_FLOAT_EQ(req.guidance, 6.0f);
    EXPECT_EQ(req.seed, int64_t{1234});
    EXPECT_TRUE(req.tiled);
}

TEST(ParseGenerationJson, SeedMinusOneOrNullIsRandom) {
    auto minus_one = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                           json{{"prompt", "x"}, {"seed", -1}});
    ASSERT_TRUE(minus_one);
    EXPECT_FALSE(minus_one.value().seed.has_value());

    auto null_seed = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                           json{{"prompt", "x"}, {"seed", nullptr}});
    ASSERT_TRUE(null_seed);
    EXPECT_FALSE(null_seed.value().seed.has_value());
}

TEST(ParseGenerationJson, RejectsBadShapes) {
    EXPECT_FALSE(parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE, json::array()));
    EXPECT_FALSE(parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE, json{{"width", 512}}));

    auto wrong_type = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                            json{{"prompt", "x"}, {"width", "wide"}});
    ASSERT_FALSE(wrong_type);
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::ValidationError);
}

TEST(ParseGenerationJson, IntegerFieldsRejectFractionsAndOverflow) {
    auto fractional = parse_generation_json(ModelFamily::FLUX, GenerationMode::TEXT_TO_IMAGE,
                                            json{{"prompt", "x"}, {"width", 1024.7}});
    ASSERT_FALSE(fractional);
    EXPECT_EQ(fractional.error().kind, ErrorKind::ValidationError);
    EXPECT_NE(fractional.error().message.find("'width'"), std::string::npos);

    auto fractional_steps = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                                  json{{"prompt", "x"}, {"steps", 20.0}});
    EXPECT_FALSE(fractional_steps);

    // Above INT64_MAX must not wrap around to -1 (random)
    auto huge_seed = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                           json{{"prompt", "x"}, {"seed", 18446744073709551615ULL}});
    ASSERT_FALSE(huge_seed);
    EXPECT_NE(huge_seed.error().message.find("'seed'"), std::string::npos);

    auto huge_width = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                            json{{"prompt", "x"}, {"width", 5000000000LL}});
    EXPECT_FALSE(huge_width);

    auto null_width = parse_generation_json(ModelFamily::SDXL, GenerationMode::TEXT_TO_IMAGE,
                                            json{{"prompt", "x"}, {"width", nullptr}});
    ASSERT_TRUE(null_width);
    EXPECT_EQ(null_width.value().size.width, 1024);
}

TEST(ParseGenerationJson, ImageToImageDecodesSource) {
    json body = {
        {"prompt", "repaint"},
        {"image", png_data_url(20, 10)},
        {"denoising_strength", 0.4}
    };
    auto parsed = parse_generation_json(ModelFamily::FLUX, GenerationMode::IMAGE_TO_IMAGE, body);
    ASSERT_TRUE(parsed) << parsed.error().message;
    ASSERT_TRUE(parsed.value().input_image.has_value());
    EXPECT_EQ(parsed.value().input_image->size(), (ImageSize{20, 10}));
    EXPECT_FLOAT_EQ(parsed.value().denoising_strength, 0.4f);
    EXPECT_EQ(parsed.value().mode, GenerationMode::IMAGE_TO_IMAGE);
}

TEST(ParseGenerationJson, ImageToImageNeedsValidImage) {
    auto missing = parse_generation_json(ModelFamily::FLUX, GenerationMode::IMAGE_TO_IMAGE,
                                         json{{"prompt", "x"}});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::ValidationError);

    auto garbage = parse_generation_json(ModelFamily::FLUX, GenerationMode::IMAGE_TO_IMAGE,
                                         json{{"prompt", "x"}, {"image", "aGVsbG8="}});
    ASSERT_FALSE(garbage);
    EXPECT_EQ(garbage.error().kind, ErrorKind::ValidationError);
}

// =============================================================================
// MULTIPART REQUESTS
// =============================================================================

TEST(ParseGenerationForm, ReadsFieldsAndImage) {
    std::map<std::string, std::string> fields = {
        {"prompt", "watercolor"},
        {"width", "512"},
        {"height", "768"},
        {"strength", "0.3"},
        {"seed", "99"},
        {"tiled", "on"}
    };
    std::vector<uint8_t> image = encode_png(solid_image(4, 4, 10));

    auto parsed = parse_generation_form(ModelFamily::SDXL, fields, image);
    ASSERT_TRUE(parsed) << parsed.error().message;
    const GenerationRequest& req = parsed.value();
    EXPECT_EQ(req.mode, GenerationMode::IMAGE_TO_IMAGE);
    EXPECT_EQ(req.size, (ImageSize{512, 768}));
    EXPECT_FLOAT_EQ(req.denoising_strength, 0.3f);
    EXPECT_EQ(req.seed, int64_t{99});
    EXPECT_TRUE(req.tiled);
    EXPECT_EQ(req.steps, 20);
    ASSERT_TRUE(req.input_image.has_value());
}

TEST(ParseGenerationForm, NamesTheBadField) {
    std::map<std::string, std::string> fields = {{"prompt", "x"}, {"steps", "many"}};
    auto parsed = parse_generation_form(ModelFamily::SDXL, fields, encode_png(solid_image(4, 4, 1)));
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().kind, ErrorKind::ValidationError);
    EXPECT_NE(parsed.error().message.find("'steps'"), std::string::npos);
}

TEST(ParseGenerationForm, RejectsTrailingCharacters) {
    std::map<std::string, std::string> fields = {{"prompt", "x"}, {"width", "1024.7"}};
    auto parsed = parse_generation_form(ModelFamily::SDXL, fields, encode_png(solid_image(4, 4, 1)));
    ASSERT_FALSE(parsed);
    EXPECT_NE(parsed.error().message.find("'width'"), std::string::npos);
}

TEST(ParseGenerationForm, RequiresPromptAndImage) {
    auto no_prompt = parse_generation_form(ModelFamily::FLUX, {}, encode_png(solid_image(4, 4, 1)));
    EXPECT_FALSE(no_prompt);

    auto no_image = parse_generation_form(ModelFamily::FLUX, {{"prompt", "x"}}, {});
    ASSERT_FALSE(no_image);
    EXPECT_NE(no_image.error().message.find("image"), std::string::npos);
}

// =============================================================================
// RESPONSES
// =============================================================================

TEST(ResponseJson, ResultListsArtifactsInOrder) {
    GenerationResult result;
    result.family = ModelFamily::FLUX;
    result.seed = 42;
    result.seeds = {42, 43};
    result.generation_time_s = 1.5;
    for (int i = 0; i < 2; ++i) {
        Artifact artifact;
        artifact.id = "id" + std::to_string(i);
        artifact.url = "/images/f" + std::to_string(i) + ".png";
        artifact.data_url = "data:image/png;base64,AA==";
        result.artifacts.push_back(artifact);
    }

    json body = result_to_json(result);
    EXPECT_EQ(body["ids"], (json{"id0", "id1"}));
    EXPECT_EQ(body["image_urls"][1], "/images/f1.png");
    EXPECT_EQ(body["images"].size(), 2u);
    EXPECT_EQ(body["seed"], 42);
    EXPECT_EQ(body["seeds"], (json{42, 43}));
    EXPECT_EQ(body["model"], "flux");
    EXPECT_EQ(body["mode"], "txt2img");
    EXPECT_DOUBLE_EQ(body["generation_time"].get<double>(), 1.5);
}

TEST(ResponseJson, ErrorCarriesKindSpecificFields) {
    Error failure = Error::make(ErrorKind::GenerationFailure, "image 2 failed");
    failure.images_completed = 1;
    json body = error_to_json(failure);
    EXPECT_EQ(body["error"]["type"], "generation_failure");
    EXPECT_EQ(body["error"]["code"], 500);
    EXPECT_EQ(body["error"]["images_completed"], 1);
    EXPECT_FALSE(body["error"].contains("bytes_still_held"));

    Error exhausted = Error::make(ErrorKind::ResourceExhausted, "held");
    exhausted.bytes_still_held = 123;
    json denied = error_to_json(exhausted);
    EXPECT_EQ(denied["error"]["code"], 503);
    EXPECT_EQ(denied["error"]["bytes_still_held"], 123);

    json busy = error_to_json(Error::make(ErrorKind::Busy, "wait"));
    EXPECT_EQ(busy["error"]["type"], "server_busy");
}

TEST(ResponseJson, DefaultModelPrefersAvailableFlux) {
    std::vector<FamilyCapability> capabilities;
    for (ModelFamily family : all_families()) {
        FamilyCapability capability;
        capability.traits = &family_traits(family);
        capability.available = true;
        if (family == ModelFamily::SDXL) {
            capability.default_negative_prompt = "blurry";
        }
        capabilities.push_back(capability);
    }
    EXPECT_EQ(capabilities_to_json(capabilities)["default_model"], "flux");

    capabilities[1].available = false;
    json body = capabilities_to_json(capabilities);
    EXPECT_EQ(body["default_model"], "sdxl");

    const json& sdxl = body["models"][0];
    EXPECT_EQ(sdxl["id"], "sdxl");
    EXPECT_TRUE(sdxl["parameters"].contains("negative_prompt"));
    EXPECT_EQ(sdxl["parameters"]["negative_prompt"]["default"], "blurry");
    EXPECT_NEAR(sdxl["parameters"]["cfg_scale"]["step"].get<double>(), 0.5, 1e-6);
    EXPECT_TRUE(sdxl["parameters"].contains("cfg_scale"));
    EXPECT_EQ(sdxl["parameters"]["width"]["step"], 8);

    const json& flux = body["models"][1];
    EXPECT_FALSE(flux["parameters"].contains("negative_prompt"));
    EXPECT_TRUE(flux["parameters"].contains("guidance"));
    EXPECT_NEAR(flux["parameters"]["guidance"]["step"].get<double>(), 0.1, 1e-6);
    EXPECT_EQ(flux["parameters"]["width"]["step"], 16);
}

TEST(ResponseJson, SlotStatus) {
    SlotStatus status;
    status.state = SlotState::Resident;
    status.family = ModelFamily::SDXL;
    status.generation = 3;
    status.stats.evictions = 2;

    json body = slot_status_to_json(status);
    EXPECT_EQ(body["state"], "resident");
    EXPECT_EQ(body["family"], "sdxl");
    EXPECT_EQ(body["generation"], 3);
    EXPECT_EQ(body["waiting"], 0);
    EXPECT_EQ(body["stats"]["evictions"], 2);

    status.family.reset();
    EXPECT_TRUE(slot_status_to_json(status)["family"].is_null());
}
