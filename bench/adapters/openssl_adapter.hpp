#pragma once
#include "cipher_adapter.hpp"
#include <cstddef>
#include <openssl/evp.h>
#include <memory>
#include <vector>
#include <string>

class OpenSSL_AES_ECB_Adapter : public CipherAdapter {
public:
    OpenSSL_AES_ECB_Adapter();
    ~OpenSSL_AES_ECB_Adapter() override = default;

    void setKey(const std::vector<uint8_t>& key) override;

    void encryptBlock(const uint8_t* in, uint8_t* out) override;
    void decryptBlock(const uint8_t* in, uint8_t* out) override;

    std::string sourceName() const override { return "OpenSSL"; }

private:
    struct CtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };

    const EVP_CIPHER* selectCipher() const;
    void run(const uint8_t* in, uint8_t* out, int enc);

    std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> ctx_;
    size_t keySizeBytes_ = 0;        // 16, 24, 32
    std::vector<uint8_t> key_;
};
