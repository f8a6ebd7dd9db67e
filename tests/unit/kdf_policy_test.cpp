#include "chunkvault/core/KdfPolicy.hpp"

#include <gtest/gtest.h>

using chunkvault::crypto::Argon2idParams;
using chunkvault::crypto::isSupportedArgon2idParams;

TEST(KdfPolicy, DefaultsAreSupported)
{
    const auto params{ chunkvault::core::defaultArgon2idParams() };
    EXPECT_TRUE(isSupportedArgon2idParams(params));
    EXPECT_EQ(params.memoryKiB, 64U * 1024U);
}

TEST(KdfPolicy, ZeroOverridesKeepDefaults)
{
    const auto resolved{ chunkvault::core::resolveArgon2idParams(0U, 0U) };
    ASSERT_TRUE(resolved.has_value());
    const auto defaults{ chunkvault::core::defaultArgon2idParams() };
    EXPECT_EQ(resolved->iterations, defaults.iterations);
    EXPECT_EQ(resolved->memoryKiB, defaults.memoryKiB);
    EXPECT_EQ(resolved->parallelism, defaults.parallelism);
}

TEST(KdfPolicy, OverridesApplyIndependently)
{
    const auto cheap{ chunkvault::core::resolveArgon2idParams(1U, 8U) };
    ASSERT_TRUE(cheap.has_value());
    EXPECT_EQ(cheap->iterations, 1U);
    EXPECT_EQ(cheap->memoryKiB, 8U);

    const auto slower{ chunkvault::core::resolveArgon2idParams(5U, 0U) };
    ASSERT_TRUE(slower.has_value());
    EXPECT_EQ(slower->iterations, 5U);
    EXPECT_EQ(slower->memoryKiB, chunkvault::core::defaultArgon2idParams().memoryKiB);
}

TEST(KdfPolicy, OutOfRangeOverridesAreRejected)
{
    EXPECT_FALSE(chunkvault::core::resolveArgon2idParams(11U, 0U).has_value());
    EXPECT_FALSE(chunkvault::core::resolveArgon2idParams(0U, 4U).has_value());
    EXPECT_FALSE(chunkvault::core::resolveArgon2idParams(0U, 10U).has_value());
    EXPECT_FALSE(chunkvault::core::resolveArgon2idParams(0U, (1024U * 1024U) + 4U).has_value());
}

TEST(KdfPolicy, SupportedRangeFollowsLaneLayout)
{
    EXPECT_TRUE(isSupportedArgon2idParams(Argon2idParams{ .iterations = 1U, .memoryKiB = 32U, .parallelism = 4U }));
    EXPECT_FALSE(isSupportedArgon2idParams(Argon2idParams{ .iterations = 1U, .memoryKiB = 24U, .parallelism = 4U }));
    EXPECT_FALSE(isSupportedArgon2idParams(Argon2idParams{ .iterations = 1U, .memoryKiB = 36U, .parallelism = 4U }));
    EXPECT_FALSE(isSupportedArgon2idParams(Argon2idParams{ .iterations = 1U, .memoryKiB = 64U, .parallelism = 17U }));
    EXPECT_FALSE(isSupportedArgon2idParams(Argon2idParams{ .iterations = 0U, .memoryKiB = 64U, .parallelism = 1U }));
}

TEST(KdfPolicy, MetadataCarriesParamsAndFreshSalt)
{
    const Argon2idParams params{ .iterations = 2U, .memoryKiB = 16U, .parallelism = 1U };
    const auto a{ chunkvault::core::makeKdfMetadata(params) };
    const auto b{ chunkvault::core::makeKdfMetadata(params) };
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_EQ(a->policyVersion, chunkvault::crypto::g_kKdfPolicyVersion);
    EXPECT_EQ(a->algorithm, chunkvault::crypto::KdfAlgorithm::Argon2id);
    EXPECT_EQ(a->argon2id.iterations, 2U);
    EXPECT_EQ(a->argon2id.memoryKiB, 16U);
    EXPECT_NE(a->salt, b->salt);
}
