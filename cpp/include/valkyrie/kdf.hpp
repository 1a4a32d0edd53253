#pragma once

#include "valkyrie/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace valkyrie {

using Bytes = std::vector<std::uint8_t>;

// Symmetric key bytes. Move-only; the buffer is wiped when released.
class KeyMaterial {
public:
    KeyMaterial() = default;
    explicit KeyMaterial(Bytes bytes) : bytes_(std::move(bytes)) {}
    ~KeyMaterial();

    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;
    KeyMaterial(KeyMaterial&& other) noexcept;
    KeyMaterial& operator=(KeyMaterial&& other) noexcept;

    const std::uint8_t* data() const noexcept { return bytes_.data(); }
    std::size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }
    const Bytes& bytes() const noexcept { return bytes_; }

    bool operator==(const KeyMaterial& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const KeyMaterial& other) const { return !(*this == other); }

private:
    void Wipe() noexcept;

    Bytes bytes_;
};

}  // namespace valkyrie

namespace valkyrie::kdf {

struct KdfParams {
    std::size_t length = constants::kKeyLength;
    std::uint32_t time_cost = constants::kArgon2TimeCost;
    std::uint32_t memory_cost = constants::kArgon2MemoryCost;  // KiB
    std::uint32_t parallelism = constants::kArgon2Parallelism;

    // Defaults overridden by VALKYRIE_ARGON2_TIME, VALKYRIE_ARGON2_MEMORY
    // and VALKYRIE_ARGON2_PARALLELISM.
    static KdfParams FromEnvironment();
};

bool IsAvailable();

// Argon2id over the UTF-8 bytes of secret and salt. Deterministic.
KeyMaterial DeriveKey(const std::string& secret, const std::string& salt, const KdfParams& params = {});

// Key bound to a machine identifier: secret is the id repeated twice, salt is the id.
KeyMaterial DeriveMachineKey(const std::string& machine_id, const KdfParams& params = {});

}  // namespace valkyrie::kdf
