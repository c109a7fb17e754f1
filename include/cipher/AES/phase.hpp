#pragma once
#include <cstdint>
#include <vector>

#include <cipher/AES/block.hpp>

class AES;

// Plain and cipher blocks are separate types so the only way from one to the
// other is AES::encrypt (Plain -> Cipher) or AES::decrypt (Cipher -> Plain).

class PlainBlock
{
public:
    static PlainBlock fromBytes(const std::vector<uint8_t>& bytes);

    std::vector<uint8_t> bytes() const;
    const Block::State& state() const { return st; }

    bool operator==(const PlainBlock& other) const = default;

private:
    friend class AES;
    explicit PlainBlock(const Block::State& st) : st(st) {}

    Block::State st;
};

class CipherBlock
{
public:
    static CipherBlock fromBytes(const std::vector<uint8_t>& bytes);

    std::vector<uint8_t> bytes() const;
    const Block::State& state() const { return st; }

    bool operator==(const CipherBlock& other) const = default;

private:
    friend class AES;
    explicit CipherBlock(const Block::State& st) : st(st) {}

    Block::State st;
};

// Throw InvalidLength unless exactly 16 bytes.
PlainBlock newPlain(const std::vector<uint8_t>& bytes);
CipherBlock newCipher(const std::vector<uint8_t>& bytes);
