#pragma once

#include <array>
#include <cstdint>
#include <span>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace shared::io {

using CipherKey = std::array<std::uint8_t, 16>;

// AES-128 in CFB8 mode, the protocol's stream cipher. The shared secret is
// used as both key and IV. One instance per direction; state carries across
// update() calls so arbitrary chunking yields the same stream.
class Cfb8Cipher {
public:
    enum class Mode : std::uint8_t {
        Encrypt,
        Decrypt,
    };

    Cfb8Cipher(const CipherKey& key, Mode mode);
    ~Cfb8Cipher();

    Cfb8Cipher(const Cfb8Cipher&) = delete;
    Cfb8Cipher& operator=(const Cfb8Cipher&) = delete;

    // Transforms bytes in place. CFB8 output length always equals input length.
    void update(std::span<std::uint8_t> bytes);

    Mode mode() const { return mode_; }

private:
    EVP_CIPHER_CTX* ctx_{nullptr};
    Mode mode_;
};

} // namespace shared::io
