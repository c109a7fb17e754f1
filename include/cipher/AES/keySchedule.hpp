#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <cipher/AES/block.hpp>

// Ordered round keys produced by an external key expansion.
// Holds 11, 13 or 15 keys (AES-128/192/256), already in state layout.
class KeySchedule
{
public:
    using RoundKey = Block::State;

    static constexpr size_t AES128_KEYS = 11;
    static constexpr size_t AES192_KEYS = 13;
    static constexpr size_t AES256_KEYS = 15;

    explicit KeySchedule(std::vector<RoundKey> roundKeys);

    // Each entry is one raw 16-byte round key in FIPS-197 byte order.
    static KeySchedule fromRoundKeys(const std::vector<std::vector<uint8_t>>& roundKeys);
    // Concatenated raw round keys: 176, 208 or 240 bytes.
    static KeySchedule fromBytes(const std::vector<uint8_t>& bytes);

    static bool isValidCount(size_t count);

    size_t size() const { return roundKeys.size(); }
    size_t rounds() const { return roundKeys.size() - 1; }

    const RoundKey& operator[](size_t i) const { return roundKeys[i]; }
    const RoundKey& front() const { return roundKeys.front(); }
    const RoundKey& back() const { return roundKeys.back(); }

private:
    std::vector<RoundKey> roundKeys;
};
