/**
 * @file test_resource_guard.cpp
 * @brief Admission control against a fake device
 */

#include <gtest/gtest.h>

#include "deestudio/resource_guard.h"
#include "test_helpers.h"

using namespace deestudio;
using namespace deestudio::testing_support;

TEST(ResourceGuard, AdmitsWhenResidualBelowThreshold) {
    auto memory = std::make_shared<FakeDeviceMemory>();
    memory->set_pinned(512ULL * 1024 * 1024);
    ResourceGuard guard(memory, kGiB);

    Status status = guard.admit();
    EXPECT_TRUE(status);

    GuardStats stats = guard.stats();
    EXPECT_EQ(stats.reclaims, 1u);
    EXPECT_EQ(stats.admissions, 1u);
    EXPECT_EQ(stats.denials, 0u);
    EXPECT_EQ(stats.last_measured_bytes, 512ULL * 1024 * 1024);
}

TEST(ResourceGuard, ReclaimReleasesCachedBlocksBeforeMeasuring) {
    auto memory = std::make_shared<FakeDeviceMemory>();
    memory->set_reclaimable(8 * kGiB);
    ResourceGuard guard(memory, kGiB);

    EXPECT_EQ(guard.force_reclaim(), 0u);
    EXPECT_EQ(memory->releases(), 1);
    EXPECT_GE(memory->syncs(), 1);
    EXPECT_TRUE(guard.admit());
}

TEST(ResourceGuard, DeniesWithResidualByteCount) {
    auto memory = std::make_shared<FakeDeviceMemory>();
    memory->set_pinned(3 * kGiB);
    ResourceGuard guard(memory, kGiB);

    Status status = guard.admit();
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().kind, ErrorKind::ResourceExhausted);
    EXPECT_EQ(status.error().http_status, 503);
    EXPECT_EQ(status.error().bytes_still_held, 3 * kGiB);
    EXPECT_EQ(status.error().message,
              "GPU memory not freed. 3.00 GB still allocated. Please restart the server.");
    EXPECT_EQ(guard.stats().denials, 1u);
}

TEST(ResourceGuard, ThresholdIsInclusive) {
    auto memory = std::make_shared<FakeDeviceMemory>();
    memory->set_pinned(kGiB);
    ResourceGuard guard(memory, kGiB);

    AdmissionResult result = guard.check_admission();
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(result.bytes_still_held, kGiB);
    EXPECT_EQ(result.threshold_bytes, kGiB);
}

TEST(ResourceGuard, NullDeviceFallsBackToHost) {
    ResourceGuard guard(nullptr);
    EXPECT_EQ(guard.memory().describe(), "CPU");
    EXPECT_FALSE(guard.memory().is_accelerator());
    EXPECT_TRUE(guard.admit());
}

TEST(ResourceGuard, FormatGb) {
    EXPECT_EQ(format_gb(0), "0.00 GB");
    EXPECT_EQ(format_gb(kGiB + kGiB / 4), "1.25 GB");
}
