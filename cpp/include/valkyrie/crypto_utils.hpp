#pragma once

#include <openssl/evp.h>

#include <memory>

namespace valkyrie::crypto::detail {

// RAII wrappers for OpenSSL resources
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

inline UniqueCipherCtx NewCipherCtx() {
    return UniqueCipherCtx(EVP_CIPHER_CTX_new());
}

inline UniqueMDCtx NewMDCtx() {
    return UniqueMDCtx(EVP_MD_CTX_new());
}

}  // namespace valkyrie::crypto::detail
