#include "crypto_pp_adapter.hpp"
#include <stdexcept>

void CryptoPP_AES_ECB_Adapter::setKey(const std::vector<uint8_t>& key) {
    if (!enc_.IsValidKeyLength(key.size())) {
        throw std::invalid_argument("CryptoPP_AES_ECB_Adapter: key must be 16, 24, or 32 bytes");
    }
    enc_.SetKey(key.data(), key.size());
    dec_.SetKey(key.data(), key.size());
    keySet_ = true;
}

void CryptoPP_AES_ECB_Adapter::encryptBlock(const uint8_t* in, uint8_t* out) {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    enc_.ProcessData(out, in, BLOCK_SIZE);
}

void CryptoPP_AES_ECB_Adapter::decryptBlock(const uint8_t* in, uint8_t* out) {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    dec_.ProcessData(out, in, BLOCK_SIZE);
}
