/**
 * @file test_config.cpp
 * @brief Config file merging, environment overrides and validation
 */

#include <gtest/gtest.h>

#include "deestudio/config.h"
#include "test_helpers.h"

#include <cstdlib>

using namespace deestudio;
using namespace deestudio::testing_support;

namespace {

class ConfigTest : public TempDirTest {
protected:
    void TearDown() override {
        unsetenv("DEESTUDIO_MODELS_ROOT");
        unsetenv("DEESTUDIO_OUTPUT_DIR");
        unsetenv("DEESTUDIO_CONFIG_PATH");
        TempDirTest::TearDown();
    }
};

}  // namespace

TEST_F(ConfigTest, DefaultsAreValid) {
    StudioConfig config;
    EXPECT_EQ(validate_config(config), "");
    EXPECT_EQ(config.port, 8000);
    EXPECT_TRUE(config.flux_offload);
    EXPECT_FALSE(config.sdxl_offload);
    EXPECT_EQ(config.admission_threshold_bytes(), 1024ULL * 1024 * 1024);
}

TEST_F(ConfigTest, MissingFileLeavesDefaults) {
    StudioConfig config;
    std::string error;
    EXPECT_FALSE(load_config_file((root_ / "absent.json").string(), config, error));
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(config.host, "127.0.0.1");
}

TEST_F(ConfigTest, SectionedKeysAreMerged) {
    fs::path path = touch("config.json", R"({
        "server": {"host": "0.0.0.0", "port": 9100, "queue_timeout_ms": 5000},
        "paths": {"models_root": "/srv/models", "output_dir": "/srv/out"},
        "runtime": {"flux_offload": false, "admission_threshold_mb": 512,
                    "overlay_strength": 0.7, "sd_log_level": "WARN"}
    })");

    StudioConfig config;
    std::string error;
    ASSERT_TRUE(load_config_file(path.string(), config, error)) << error;
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.models_root, "/srv/models");
    EXPECT_EQ(config.output_dir, "/srv/out");
    EXPECT_FALSE(config.flux_offload);
    EXPECT_EQ(config.admission_threshold_mb, 512);
    EXPECT_FLOAT_EQ(config.overlay_strength, 0.7f);
    EXPECT_EQ(config.sd_log_level, "warn");

    CacheOptions options = config.cache_options();
    EXPECT_EQ(options.queue_timeout.count(), 5000);
    EXPECT_FALSE(options.offload_for(ModelFamily::FLUX));
    EXPECT_EQ(config.registry_config().models_root, fs::path("/srv/models"));
    EXPECT_EQ(config.artifact_config().output_dir, fs::path("/srv/out"));
}

TEST_F(ConfigTest, TopLevelKeysAndOutOfRangeValues) {
    fs::path path = touch("config.json", R"({"port": 70000, "thread_pool_size": 4, "sd_log_level": "loud"})");

    StudioConfig config;
    std::string error;
    ASSERT_TRUE(load_config_file(path.string(), config, error));
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.thread_pool_size, 4);
    EXPECT_EQ(config.sd_log_level, "info");
}

TEST_F(ConfigTest, MalformedFileReportsError) {
    fs::path path = touch("config.json", "{ not json");
    StudioConfig config;
    std::string error;
    EXPECT_FALSE(load_config_file(path.string(), config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    setenv("DEESTUDIO_MODELS_ROOT", "/env/models", 1);
    setenv("DEESTUDIO_OUTPUT_DIR", "/env/out", 1);

    StudioConfig config;
    config.models_root = "/file/models";
    apply_env_overrides(config);
    EXPECT_EQ(config.models_root, "/env/models");
    EXPECT_EQ(config.output_dir, "/env/out");
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
    setenv("DEESTUDIO_CONFIG_PATH", "/etc/deestudio.json", 1);
    EXPECT_EQ(default_config_path(), "/etc/deestudio.json");
}

TEST_F(ConfigTest, EmptyOverlayPathDisablesOverlay) {
    StudioConfig config;
    config.overlay_path.clear();
    EXPECT_FALSE(config.registry_config().overlay_family.has_value());
}

TEST_F(ConfigTest, QueueCapLeavesWorkersFree) {
    StudioConfig config;
    EXPECT_EQ(config.cache_options().max_waiters, 6u);

    config.thread_pool_size = 2;
    EXPECT_EQ(config.cache_options().max_waiters, 0u);

    config = StudioConfig();
    config.max_queued_requests = 3;
    EXPECT_EQ(validate_config(config), "");
    EXPECT_EQ(config.cache_options().max_waiters, 3u);

    config.max_queued_requests = 7;
    EXPECT_NE(validate_config(config), "");
}

TEST_F(ConfigTest, QueueCapFromFile) {
    fs::path path = touch("config.json", R"({"server": {"thread_pool_size": 16, "max_queued_requests": 10}})");
    StudioConfig config;
    std::string error;
    ASSERT_TRUE(load_config_file(path.string(), config, error)) << error;
    EXPECT_EQ(config.max_queued_requests, 10);
    EXPECT_EQ(config.cache_options().max_waiters, 10u);
}

TEST_F(ConfigTest, ValidationCatchesBadValues) {
    StudioConfig config;
    config.images_url_prefix = "images";
    EXPECT_NE(validate_config(config), "");

    config = StudioConfig();
    config.overlay_strength = 3.0f;
    EXPECT_NE(validate_config(config), "");

    config = StudioConfig();
    config.thread_pool_size = 0;
    EXPECT_NE(validate_config(config), "");
}
