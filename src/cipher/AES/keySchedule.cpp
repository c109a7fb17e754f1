#include "cipher/AES/keySchedule.hpp"
#include "cipher/AES/errors.hpp"

#include <string>
#include <utility>

KeySchedule::KeySchedule(std::vector<RoundKey> roundKeys)
    : roundKeys(std::move(roundKeys))
{
    if (!isValidCount(this->roundKeys.size()))
    {
        throw InvalidKeySchedule("Key schedule must hold 11, 13, or 15 round keys (AES-128/192/256). Got: "
            + std::to_string(this->roundKeys.size()));
    }
}

bool KeySchedule::isValidCount(size_t count)
{
    return count == AES128_KEYS || count == AES192_KEYS || count == AES256_KEYS;
}

KeySchedule KeySchedule::fromRoundKeys(const std::vector<std::vector<uint8_t>>& roundKeys)
{
    if (!isValidCount(roundKeys.size()))
    {
        throw InvalidKeySchedule("Key schedule must hold 11, 13, or 15 round keys (AES-128/192/256). Got: "
            + std::to_string(roundKeys.size()));
    }

    std::vector<RoundKey> keys;
    keys.reserve(roundKeys.size());
    for (size_t i = 0; i < roundKeys.size(); i++)
    {
        Block::requireSize(roundKeys[i].size(), "Round key " + std::to_string(i));
        keys.push_back(Block::fromBytes(roundKeys[i].data()));
    }
    return KeySchedule(std::move(keys));
}

KeySchedule KeySchedule::fromBytes(const std::vector<uint8_t>& bytes)
{
    if (bytes.size() % Block::SIZE != 0 || !isValidCount(bytes.size() / Block::SIZE))
    {
        throw InvalidKeySchedule("Key schedule must be 176, 208, or 240 bytes. Got: "
            + std::to_string(bytes.size()) + " bytes");
    }

    std::vector<RoundKey> keys;
    keys.reserve(bytes.size() / Block::SIZE);
    for (size_t i = 0; i < bytes.size(); i += Block::SIZE)
        keys.push_back(Block::fromBytes(&bytes[i]));
    return KeySchedule(std::move(keys));
}
