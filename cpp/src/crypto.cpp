#include "valkyrie/crypto.hpp"

#include "valkyrie/constants.hpp"
#include "valkyrie/crypto_utils.hpp"
#include "valkyrie/errors.hpp"
#include "valkyrie/hex.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace valkyrie::crypto {

namespace {

using detail::NewCipherCtx;
using detail::NewMDCtx;
using detail::UniqueCipherCtx;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

const EVP_CIPHER* SelectCipher(EncryptionMode mode, std::size_t key_len) {
    switch (mode) {
        case EncryptionMode::Gcm:
            if (key_len == 16) return EVP_aes_128_gcm();
            if (key_len == 24) return EVP_aes_192_gcm();
            if (key_len == 32) return EVP_aes_256_gcm();
            return nullptr;
        case EncryptionMode::Ctr:
            if (key_len == 16) return EVP_aes_128_ctr();
            if (key_len == 24) return EVP_aes_192_ctr();
            if (key_len == 32) return EVP_aes_256_ctr();
            return nullptr;
        case EncryptionMode::Cbc:
            if (key_len == 16) return EVP_aes_128_cbc();
            if (key_len == 24) return EVP_aes_192_cbc();
            if (key_len == 32) return EVP_aes_256_cbc();
            return nullptr;
    }
    return nullptr;
}

Bytes CounterBlock(const Bytes& nonce) {
    Bytes block(constants::kAesBlockLen, 0);
    std::copy(nonce.begin(), nonce.end(), block.begin());
    return block;
}

Bytes GcmEncrypt(const EVP_CIPHER* cipher,
                 const KeyMaterial& key,
                 const Bytes& nonce,
                 const Bytes& plaintext,
                 Bytes& tag) {
    UniqueCipherCtx ctx = NewCipherCtx();
    Ensure(ctx != nullptr, "AES-GCM context allocation failed");
    Bytes ciphertext(plaintext.size());
    tag.assign(constants::kGcmTagLen, 0);
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) == 1, "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1,
           "AES-GCM set key failed");
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len, plaintext.data(),
                                 static_cast<int>(plaintext.size())) == 1,
               "AES-GCM encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &out_len) == 1, "AES-GCM final failed");
    total_len += out_len;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM get tag failed");
    ciphertext.resize(static_cast<std::size_t>(total_len));
    return ciphertext;
}

Bytes GcmDecrypt(const EVP_CIPHER* cipher,
                 const KeyMaterial& key,
                 const Bytes& nonce,
                 const Bytes& ciphertext,
                 Bytes tag) {
    UniqueCipherCtx ctx = NewCipherCtx();
    Ensure(ctx != nullptr, "AES-GCM context allocation failed");
    Bytes plaintext(ciphertext.size());
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) == 1, "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1,
           "AES-GCM set key failed");
    if (!ciphertext.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext.data(),
                                 static_cast<int>(ciphertext.size())) == 1,
               "AES-GCM decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
        throw AuthenticationFailed("AES-GCM auth failed");
    }
    total_len += out_len;
    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

// CTR and CBC share one EVP path; CBC uses the default PKCS#7 padding.
Bytes CipherTransform(const EVP_CIPHER* cipher,
                      const KeyMaterial& key,
                      const Bytes& iv,
                      const Bytes& data,
                      bool encrypt) {
    UniqueCipherCtx ctx = NewCipherCtx();
    Ensure(ctx != nullptr, "AES context allocation failed");
    Bytes out(data.size() + constants::kAesBlockLen);
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_CipherInit_ex(ctx.get(), cipher, nullptr, key.data(), iv.data(), encrypt ? 1 : 0) == 1,
           "AES init failed");
    if (!data.empty()) {
        Ensure(EVP_CipherUpdate(ctx.get(), out.data(), &out_len, data.data(), static_cast<int>(data.size())) == 1,
               "AES update failed");
        total_len += out_len;
    }
    Ensure(EVP_CipherFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1,
           encrypt ? "AES final failed" : "AES final failed (bad padding)");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

Bytes DecodeField(const std::string& value, const char* field) {
    bool ok = false;
    Bytes out = hex::Decode(value, &ok);
    if (!ok) {
        throw DecryptionError("Malformed envelope", std::string(field) + " is not valid hex");
    }
    return out;
}

}  // namespace

const char* ModeName(EncryptionMode mode) {
    switch (mode) {
        case EncryptionMode::Gcm:
            return "AES-GCM";
        case EncryptionMode::Ctr:
            return "AES-CTR";
        case EncryptionMode::Cbc:
            return "AES-CBC";
    }
    return "";
}

std::optional<EncryptionMode> TryModeFromName(std::string_view name) {
    for (EncryptionMode mode : {EncryptionMode::Gcm, EncryptionMode::Ctr, EncryptionMode::Cbc}) {
        if (name == ModeName(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

EncryptionMode ModeFromName(std::string_view name) {
    auto mode = TryModeFromName(name);
    if (!mode) {
        throw EncryptionError("Unsupported encryption mode: " + std::string(name));
    }
    return *mode;
}

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

void CheckInputSize(std::size_t size, bool encrypt) {
    if (size <= kMaxInputSize) {
        return;
    }
    const std::string cause = std::to_string(size) + " bytes, limit is " + std::to_string(kMaxInputSize);
    if (encrypt) {
        throw EncryptionError("Plaintext too large for a single cipher call", cause);
    }
    throw DecryptionError("Ciphertext too large for a single cipher call", cause);
}

EncryptedEnvelope Encrypt(const KeyMaterial& key, const Bytes& plaintext, EncryptionMode mode) {
    const EVP_CIPHER* cipher = SelectCipher(mode, key.size());
    if (!cipher) {
        throw EncryptionError(std::string(ModeName(mode)) + " expects a 16, 24 or 32-byte key",
                              "got " + std::to_string(key.size()) + " bytes");
    }
    CheckInputSize(plaintext.size(), true);
    try {
        EncryptedEnvelope envelope;
        switch (mode) {
            case EncryptionMode::Gcm: {
                Bytes nonce = RandomBytes(constants::kGcmNonceLen);
                Bytes tag;
                Bytes ciphertext = GcmEncrypt(cipher, key, nonce, plaintext, tag);
                envelope.ciphertext = hex::Encode(ciphertext);
                envelope.iv = hex::Encode(nonce);
                envelope.tag = hex::Encode(tag);
                break;
            }
            case EncryptionMode::Ctr: {
                Bytes nonce = RandomBytes(constants::kCtrNonceLen);
                envelope.ciphertext = hex::Encode(CipherTransform(cipher, key, CounterBlock(nonce), plaintext, true));
                envelope.iv = hex::Encode(nonce);
                break;
            }
            case EncryptionMode::Cbc: {
                Bytes iv = RandomBytes(constants::kAesBlockLen);
                envelope.ciphertext = hex::Encode(CipherTransform(cipher, key, iv, plaintext, true));
                envelope.iv = hex::Encode(iv);
                break;
            }
        }
        return envelope;
    } catch (const std::exception& exc) {
        throw EncryptionError(std::string(ModeName(mode)) + " encryption failed", exc.what());
    }
}

Bytes Decrypt(const KeyMaterial& key, const EncryptedEnvelope& envelope, EncryptionMode mode) {
    const EVP_CIPHER* cipher = SelectCipher(mode, key.size());
    if (!cipher) {
        throw DecryptionError(std::string(ModeName(mode)) + " expects a 16, 24 or 32-byte key",
                              "got " + std::to_string(key.size()) + " bytes");
    }
    CheckInputSize(envelope.ciphertext.size() / 2, false);
    Bytes ciphertext = DecodeField(envelope.ciphertext, "ciphertext");
    Bytes iv = DecodeField(envelope.iv, "iv");

    try {
        switch (mode) {
            case EncryptionMode::Gcm: {
                if (!envelope.tag || envelope.tag->empty()) {
                    throw DecryptionError("Malformed envelope", "AES-GCM envelope has no tag");
                }
                Bytes tag = DecodeField(*envelope.tag, "tag");
                if (tag.size() != constants::kGcmTagLen) {
                    throw AuthenticationFailed("tag is " + std::to_string(tag.size()) + " bytes");
                }
                if (iv.empty()) {
                    throw DecryptionError("Malformed envelope", "AES-GCM nonce is empty");
                }
                return GcmDecrypt(cipher, key, iv, ciphertext, std::move(tag));
            }
            case EncryptionMode::Ctr:
                if (iv.size() != constants::kCtrNonceLen) {
                    throw DecryptionError("Malformed envelope", "AES-CTR nonce must be 8 bytes");
                }
                return CipherTransform(cipher, key, CounterBlock(iv), ciphertext, false);
            case EncryptionMode::Cbc:
                if (iv.size() != constants::kAesBlockLen) {
                    throw DecryptionError("Malformed envelope", "AES-CBC IV must be 16 bytes");
                }
                if (ciphertext.empty() || ciphertext.size() % constants::kAesBlockLen != 0) {
                    throw DecryptionError("Malformed envelope", "AES-CBC ciphertext is not block aligned");
                }
                return CipherTransform(cipher, key, iv, ciphertext, false);
        }
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        throw DecryptionError(std::string(ModeName(mode)) + " decryption failed", exc.what());
    }
    throw DecryptionError("Unknown encryption mode");
}

Bytes Digest(const Bytes& data, std::string_view algorithm) {
    std::string name(algorithm);
    const EVP_MD* md = EVP_get_digestbyname(name.c_str());
    if (!md) {
        throw std::invalid_argument("Unsupported digest: " + name);
    }
    detail::UniqueMDCtx ctx = NewMDCtx();
    Ensure(ctx != nullptr, "Digest context allocation failed");
    unsigned int out_len = 0;
    Bytes out(static_cast<std::size_t>(EVP_MD_size(md)));
    Ensure(EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1, "Digest init failed");
    if (!data.empty()) {
        Ensure(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1, "Digest update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "Digest final failed");
    out.resize(out_len);
    return out;
}

}  // namespace valkyrie::crypto
