#pragma once
#include "cipher_adapter.hpp"
#include <aes.h>
#include <modes.h>
#include <vector>
#include <string>

class CryptoPP_AES_ECB_Adapter : public CipherAdapter {
public:
    CryptoPP_AES_ECB_Adapter() = default;
    ~CryptoPP_AES_ECB_Adapter() override = default;

    void setKey(const std::vector<uint8_t>& key) override;

    void encryptBlock(const uint8_t* in, uint8_t* out) override;
    void decryptBlock(const uint8_t* in, uint8_t* out) override;

    std::string sourceName() const override { return "Crypto++"; }

private:
    CryptoPP::ECB_Mode<CryptoPP::AES>::Encryption enc_;
    CryptoPP::ECB_Mode<CryptoPP::AES>::Decryption dec_;
    bool keySet_ = false;
};
