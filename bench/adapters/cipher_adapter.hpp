#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include <cstdint>

// Third-party AES used as a reference for the benchmark and the cross-check tests.
class CipherAdapter {
public:
    static constexpr size_t BLOCK_SIZE = 16;

    virtual ~CipherAdapter() = default;
    virtual void setKey(const std::vector<uint8_t>& key) = 0;
    virtual void encryptBlock(const uint8_t* in, uint8_t* out) = 0;
    virtual void decryptBlock(const uint8_t* in, uint8_t* out) = 0;
    virtual std::string sourceName() const = 0;
};
