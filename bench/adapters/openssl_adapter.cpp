#include "openssl_adapter.hpp"
#include <stdexcept>

OpenSSL_AES_ECB_Adapter::OpenSSL_AES_ECB_Adapter()
    : ctx_(EVP_CIPHER_CTX_new())
{
    if (!ctx_) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
}

void OpenSSL_AES_ECB_Adapter::setKey(const std::vector<uint8_t>& key) {
    if (key.size() != 16 && key.size() != 24 && key.size() != 32) {
        throw std::invalid_argument("OpenSSL_AES_ECB_Adapter: key must be 16, 24, or 32 bytes");
    }
    keySizeBytes_ = key.size();
    key_ = key;
}

const EVP_CIPHER* OpenSSL_AES_ECB_Adapter::selectCipher() const {
    switch (keySizeBytes_) {
    case 16: return EVP_aes_128_ecb();
    case 24: return EVP_aes_192_ecb();
    case 32: return EVP_aes_256_ecb();
    default: throw std::runtime_error("Key not set");
    }
}

void OpenSSL_AES_ECB_Adapter::run(const uint8_t* in, uint8_t* out, int enc) {
    int outlen = 0;

    if (EVP_CipherInit_ex(ctx_.get(), selectCipher(), nullptr, key_.data(), nullptr, enc) != 1) {
        throw std::runtime_error("EVP_CipherInit_ex failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx_.get(), 0);

    if (EVP_CipherUpdate(ctx_.get(), out, &outlen, in, static_cast<int>(BLOCK_SIZE)) != 1) {
        throw std::runtime_error("EVP_CipherUpdate failed");
    }
    if (outlen != static_cast<int>(BLOCK_SIZE)) {
        throw std::runtime_error("EVP_CipherUpdate returned a short block");
    }
}

void OpenSSL_AES_ECB_Adapter::encryptBlock(const uint8_t* in, uint8_t* out) {
    run(in, out, 1);
}

void OpenSSL_AES_ECB_Adapter::decryptBlock(const uint8_t* in, uint8_t* out) {
    run(in, out, 0);
}
