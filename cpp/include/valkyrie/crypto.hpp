#pragma once

#include "valkyrie/kdf.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace valkyrie::crypto {

// Ordinals are part of the format: 0 = AES-GCM, 1 = AES-CTR, 2 = AES-CBC.
enum class EncryptionMode : std::uint8_t {
    Gcm = 0,
    Ctr = 1,
    Cbc = 2
};

// Binary fields are lowercase hex. tag is set only for EncryptionMode::Gcm.
struct EncryptedEnvelope {
    std::string ciphertext;
    std::string iv;
    std::optional<std::string> tag;
};

const char* ModeName(EncryptionMode mode);
std::optional<EncryptionMode> TryModeFromName(std::string_view name);
EncryptionMode ModeFromName(std::string_view name);

Bytes RandomBytes(std::size_t size);

// Largest buffer a single EVP call accepts (its length parameter is an int).
constexpr std::size_t kMaxInputSize = static_cast<std::size_t>(std::numeric_limits<int>::max());

// Throws EncryptionError (encrypt) or DecryptionError when size exceeds kMaxInputSize.
void CheckInputSize(std::size_t size, bool encrypt);

// Every call draws a fresh nonce/IV from the OpenSSL RNG.
EncryptedEnvelope Encrypt(const KeyMaterial& key, const Bytes& plaintext, EncryptionMode mode);

// Throws AuthenticationFailed when the GCM tag does not verify; no plaintext is returned in that case.
Bytes Decrypt(const KeyMaterial& key, const EncryptedEnvelope& envelope, EncryptionMode mode);

// Message digest by OpenSSL name ("md5", "sha1", "sha256", "sha512", ...).
Bytes Digest(const Bytes& data, std::string_view algorithm);

}  // namespace valkyrie::crypto
