#include "cipher/AES/phase.hpp"

PlainBlock PlainBlock::fromBytes(const std::vector<uint8_t>& bytes)
{
    Block::requireSize(bytes.size(), "Plaintext block");
    return PlainBlock(Block::fromBytes(bytes.data()));
}

std::vector<uint8_t> PlainBlock::bytes() const
{
    return Block::toBytes(st);
}

CipherBlock CipherBlock::fromBytes(const std::vector<uint8_t>& bytes)
{
    Block::requireSize(bytes.size(), "Ciphertext block");
    return CipherBlock(Block::fromBytes(bytes.data()));
}

std::vector<uint8_t> CipherBlock::bytes() const
{
    return Block::toBytes(st);
}

PlainBlock newPlain(const std::vector<uint8_t>& bytes)
{
    return PlainBlock::fromBytes(bytes);
}

CipherBlock newCipher(const std::vector<uint8_t>& bytes)
{
    return CipherBlock::fromBytes(bytes);
}
