#include "valkyrie/kdf.hpp"

#include "valkyrie/env.hpp"
#include "valkyrie/errors.hpp"

#include <openssl/crypto.h>

#if defined(VALKYRIE_HAS_ARGON2) && VALKYRIE_HAS_ARGON2
#include <argon2.h>
#endif

#include <utility>

namespace valkyrie {

KeyMaterial::~KeyMaterial() {
    Wipe();
}

KeyMaterial::KeyMaterial(KeyMaterial&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

KeyMaterial& KeyMaterial::operator=(KeyMaterial&& other) noexcept {
    if (this != &other) {
        Wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void KeyMaterial::Wipe() noexcept {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
}

}  // namespace valkyrie

namespace valkyrie::kdf {

namespace {

void Validate(const std::string& salt, const KdfParams& params) {
    if (params.length == 0) {
        throw KeyDerivationError("Key length must be positive");
    }
    if (params.time_cost == 0) {
        throw KeyDerivationError("Argon2 time cost must be positive");
    }
    if (params.parallelism == 0) {
        throw KeyDerivationError("Argon2 parallelism must be positive");
    }
    if (params.memory_cost < 8u * params.parallelism) {
        throw KeyDerivationError("Argon2 memory cost must be at least 8 KiB per lane");
    }
    if (salt.size() < constants::kArgon2MinSaltLen) {
        throw KeyDerivationError("Salt must be at least " + std::to_string(constants::kArgon2MinSaltLen)
                                 + " bytes");
    }
}

}  // namespace

KdfParams KdfParams::FromEnvironment() {
    KdfParams params;
    params.time_cost = env::GetUint("VALKYRIE_ARGON2_TIME", params.time_cost);
    params.memory_cost = env::GetUint("VALKYRIE_ARGON2_MEMORY", params.memory_cost);
    params.parallelism = env::GetUint("VALKYRIE_ARGON2_PARALLELISM", params.parallelism);
    return params;
}

bool IsAvailable() {
#if defined(VALKYRIE_HAS_ARGON2) && VALKYRIE_HAS_ARGON2
    return true;
#else
    return false;
#endif
}

KeyMaterial DeriveKey(const std::string& secret, const std::string& salt, const KdfParams& params) {
    Validate(salt, params);
#if defined(VALKYRIE_HAS_ARGON2) && VALKYRIE_HAS_ARGON2
    Bytes out(params.length);
    int rc = argon2id_hash_raw(params.time_cost,
                               params.memory_cost,
                               params.parallelism,
                               secret.data(),
                               secret.size(),
                               salt.data(),
                               salt.size(),
                               out.data(),
                               out.size());
    if (rc != ARGON2_OK) {
        throw KeyDerivationError("Argon2id failed", argon2_error_message(rc));
    }
    return KeyMaterial(std::move(out));
#else
    (void)secret;
    throw KeyDerivationError("Argon2 backend unavailable");
#endif
}

KeyMaterial DeriveMachineKey(const std::string& machine_id, const KdfParams& params) {
    if (machine_id.empty()) {
        throw KeyDerivationError("Machine identifier is empty");
    }
    return DeriveKey(machine_id + machine_id, machine_id, params);
}

}  // namespace valkyrie::kdf
