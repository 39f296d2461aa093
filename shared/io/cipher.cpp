#include "cipher.hpp"

#include "codec_error.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <climits>

namespace shared::io {

Cfb8Cipher::Cfb8Cipher(const CipherKey& key, Mode mode)
    : mode_(mode) {
    ctx_ = EVP_CIPHER_CTX_new();
    if (!ctx_) {
        throw CodecError(ErrorKind::Io, "EVP_CIPHER_CTX_new failed");
    }

    const int enc = (mode == Mode::Encrypt) ? 1 : 0;
    if (EVP_CipherInit_ex(ctx_, EVP_aes_128_cfb8(), nullptr, key.data(), key.data(), enc) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        ctx_ = nullptr;
        throw CodecError(ErrorKind::Io, "EVP_CipherInit_ex(aes-128-cfb8) failed");
    }
}

Cfb8Cipher::~Cfb8Cipher() {
    if (ctx_) {
        EVP_CIPHER_CTX_free(ctx_);
    }
}

void Cfb8Cipher::update(std::span<std::uint8_t> bytes) {
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const std::size_t chunk = std::min<std::size_t>(bytes.size() - offset, INT_MAX);
        int outLen = 0;
        std::uint8_t* p = bytes.data() + offset;
        if (EVP_CipherUpdate(ctx_, p, &outLen, p, static_cast<int>(chunk)) != 1 ||
            outLen != static_cast<int>(chunk)) {
            throw CodecError(ErrorKind::Io, "EVP_CipherUpdate failed");
        }
        offset += chunk;
    }
}

} // namespace shared::io
