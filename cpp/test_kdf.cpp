#include <gtest/gtest.h>

#include "valkyrie/errors.hpp"
#include "valkyrie/kdf.hpp"

#include <cstdlib>

using namespace valkyrie;

TEST(KdfTest, RejectsShortSalt) {
    EXPECT_THROW(kdf::DeriveKey("secret", "short"), KeyDerivationError);
}

TEST(KdfTest, RejectsInvalidParams) {
    kdf::KdfParams params;
    params.parallelism = 0;
    EXPECT_THROW(kdf::DeriveKey("secret", "salty-salt", params), KeyDerivationError);

    params = {};
    params.time_cost = 0;
    EXPECT_THROW(kdf::DeriveKey("secret", "salty-salt", params), KeyDerivationError);

    params = {};
    params.memory_cost = 8 * params.parallelism - 1;
    EXPECT_THROW(kdf::DeriveKey("secret", "salty-salt", params), KeyDerivationError);

    params = {};
    params.length = 0;
    EXPECT_THROW(kdf::DeriveKey("secret", "salty-salt", params), KeyDerivationError);
}

TEST(KdfTest, MachineKeyRequiresIdentifier) {
    EXPECT_THROW(kdf::DeriveMachineKey(""), KeyDerivationError);
}

TEST(KdfTest, UnavailableBackendFailsLoudly) {
    if (kdf::IsAvailable()) {
        GTEST_SKIP() << "Argon2 backend is available";
    }
    EXPECT_THROW(kdf::DeriveKey("secret", "salty-salt"), KeyDerivationError);
}

TEST(KdfTest, DeterministicForSameInputs) {
    if (!kdf::IsAvailable()) {
        GTEST_SKIP() << "Argon2 backend not built";
    }
    KeyMaterial first = kdf::DeriveKey("correct horse", "battery staple");
    KeyMaterial second = kdf::DeriveKey("correct horse", "battery staple");
    EXPECT_EQ(first.size(), 32u);
    EXPECT_EQ(first, second);
}

TEST(KdfTest, DifferentInputsGiveDifferentKeys) {
    if (!kdf::IsAvailable()) {
        GTEST_SKIP() << "Argon2 backend not built";
    }
    KeyMaterial base = kdf::DeriveKey("correct horse", "battery staple");
    EXPECT_NE(base, kdf::DeriveKey("correct horsf", "battery staple"));
    EXPECT_NE(base, kdf::DeriveKey("correct horse", "battery stapld"));
}

TEST(KdfTest, HonoursRequestedLength) {
    if (!kdf::IsAvailable()) {
        GTEST_SKIP() << "Argon2 backend not built";
    }
    kdf::KdfParams params;
    params.length = 16;
    EXPECT_EQ(kdf::DeriveKey("secret", "salty-salt", params).size(), 16u);
}

TEST(KdfTest, MachineKeyMatchesDoubledSecret) {
    if (!kdf::IsAvailable()) {
        GTEST_SKIP() << "Argon2 backend not built";
    }
    const std::string id = "0123456789abcdef";
    EXPECT_EQ(kdf::DeriveMachineKey(id), kdf::DeriveKey(id + id, id));
}

TEST(KdfTest, ParamsFromEnvironment) {
    setenv("VALKYRIE_ARGON2_TIME", "3", 1);
    setenv("VALKYRIE_ARGON2_MEMORY", "garbage", 1);
    unsetenv("VALKYRIE_ARGON2_PARALLELISM");
    kdf::KdfParams params = kdf::KdfParams::FromEnvironment();
    EXPECT_EQ(params.time_cost, 3u);
    EXPECT_EQ(params.memory_cost, 10000u);
    EXPECT_EQ(params.parallelism, 8u);
    EXPECT_EQ(params.length, 32u);
    unsetenv("VALKYRIE_ARGON2_TIME");
    unsetenv("VALKYRIE_ARGON2_MEMORY");
}
