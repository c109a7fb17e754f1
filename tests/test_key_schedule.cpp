#include "cipher/AES/keySchedule.hpp"
#include <gtest/gtest.h>
#include "cipher/AES/block.hpp"
#include "cipher/AES/errors.hpp"
#include "KeyExpansion.hpp"
#include "KATHarness.hpp"

#include <vector>

static std::vector<std::vector<uint8_t>> roundKeys(size_t count)
{
    std::vector<std::vector<uint8_t>> keys(count, std::vector<uint8_t>(16));
    for (size_t r = 0; r < count; r++)
        for (size_t i = 0; i < 16; i++)
            keys[r][i] = static_cast<uint8_t>(r * 16 + i);
    return keys;
}

TEST(KeySchedule, AcceptsSupportedLengths)
{
    for (size_t count : { 11u, 13u, 15u })
    {
        KeySchedule schedule = KeySchedule::fromRoundKeys(roundKeys(count));
        EXPECT_EQ(schedule.size(), count);
        EXPECT_EQ(schedule.rounds(), count - 1);
    }
}

TEST(KeySchedule, RejectsOtherLengths)
{
    for (size_t count : { 0u, 1u, 10u, 12u, 14u, 16u })
    {
        EXPECT_THROW(KeySchedule::fromRoundKeys(roundKeys(count)), InvalidKeySchedule)
            << "count " << count;
    }
}

TEST(KeySchedule, ConstructorValidatesCount)
{
    EXPECT_THROW((void)KeySchedule(std::vector<KeySchedule::RoundKey>(12)), InvalidKeySchedule);
    EXPECT_NO_THROW((void)KeySchedule(std::vector<KeySchedule::RoundKey>(15)));
}

TEST(KeySchedule, RejectsShortRoundKey)
{
    auto keys = roundKeys(11);
    keys[4].pop_back();
    EXPECT_THROW(KeySchedule::fromRoundKeys(keys), InvalidLength);

    keys = roundKeys(13);
    keys[12].push_back(0);
    EXPECT_THROW(KeySchedule::fromRoundKeys(keys), InvalidLength);
}

TEST(KeySchedule, FromBytesChecksTotalSize)
{
    EXPECT_EQ(KeySchedule::fromBytes(std::vector<uint8_t>(176)).size(), 11u);
    EXPECT_EQ(KeySchedule::fromBytes(std::vector<uint8_t>(208)).size(), 13u);
    EXPECT_EQ(KeySchedule::fromBytes(std::vector<uint8_t>(240)).size(), 15u);

    EXPECT_THROW(KeySchedule::fromBytes(std::vector<uint8_t>(175)), InvalidKeySchedule);
    EXPECT_THROW(KeySchedule::fromBytes(std::vector<uint8_t>(192)), InvalidKeySchedule);
    EXPECT_THROW(KeySchedule::fromBytes({}), InvalidKeySchedule);
}

TEST(KeySchedule, RoundKeysAreStoredInStateLayout)
{
    auto keys = roundKeys(11);
    KeySchedule schedule = KeySchedule::fromRoundKeys(keys);

    EXPECT_EQ(schedule[0], Block::fromBytes(keys[0]));
    EXPECT_EQ(schedule.back(), Block::fromBytes(keys[10]));
    EXPECT_EQ(Block::toBytes(schedule[5]), keys[5]);
}

TEST(KeySchedule, FlatAndPerKeyFormsAgree)
{
    std::vector<uint8_t> key = HexToBytes("000102030405060708090a0b0c0d0e0f1011121314151617");
    KeySchedule a = KeyExpansion::schedule(key);
    KeySchedule b = KeySchedule::fromBytes(KeyExpansion::flat(key));

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++)
        EXPECT_EQ(a[i], b[i]);
}

// FIPS-197 appendix A.1 (the test-side key expansion feeding the cipher)
TEST(KeySchedule, ExpansionMatchesFips197)
{
    auto keys = KeyExpansion::roundKeys(HexToBytes("2b7e151628aed2a6abf7158809cf4f3c"));

    ASSERT_EQ(keys.size(), 11u);
    EXPECT_EQ(BytesToHex(keys[1]), "a0fafe1788542cb123a339392a6c7605");
    EXPECT_EQ(BytesToHex(keys[10]), "d014f9a8c9ee2589e13f0cc8b6630ca6");

    EXPECT_EQ(KeyExpansion::roundKeys(std::vector<uint8_t>(24)).size(), 13u);
    EXPECT_EQ(KeyExpansion::roundKeys(std::vector<uint8_t>(32)).size(), 15u);
}
