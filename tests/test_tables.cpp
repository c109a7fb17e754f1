// tables.hpp goes first so it has to compile on its own includes
#include "cipher/AES/tables.hpp"
#include "cipher/AES/errors.hpp"
#include <gtest/gtest.h>

#include <numeric>
#include <stdexcept>

TEST(Tables, KnownEntries)
{
    EXPECT_EQ(SubstitutionTable::sbox[0x00], 0x63);
    EXPECT_EQ(SubstitutionTable::sbox[0x53], 0xed);
    EXPECT_EQ(SubstitutionTable::sbox[0xff], 0x16);
    EXPECT_EQ(SubstitutionTable::inv_sbox[0x63], 0x00);
    EXPECT_EQ(SubstitutionTable::inv_sbox[0x00], 0x52);
}

TEST(Tables, InverseUndoesForward)
{
    for (int x = 0; x < 256; x++)
    {
        const uint8_t b = static_cast<uint8_t>(x);
        EXPECT_EQ(SubstitutionTable::inv_sbox[SubstitutionTable::sbox[b]], b);
        EXPECT_EQ(SubstitutionTable::sbox[SubstitutionTable::inv_sbox[b]], b);
    }
}

TEST(Tables, BuiltInTablesAreBijections)
{
    EXPECT_TRUE(SubstitutionTable::isBijection(SubstitutionTable::sbox));
    EXPECT_TRUE(SubstitutionTable::isBijection(SubstitutionTable::inv_sbox));
    EXPECT_NO_THROW(SubstitutionTable::validate(SubstitutionTable::sbox));
}

TEST(Tables, InvertMatchesBuiltInInverse)
{
    EXPECT_EQ(SubstitutionTable::invert(SubstitutionTable::sbox), SubstitutionTable::inv_sbox);
    EXPECT_EQ(SubstitutionTable::invert(SubstitutionTable::inv_sbox), SubstitutionTable::sbox);
}

TEST(Tables, InvertCustomPermutation)
{
    SBox table{};
    for (int i = 0; i < 256; i++)
        table[i] = static_cast<uint8_t>(255 - i);

    SBox inverse = SubstitutionTable::invert(table);
    for (int i = 0; i < 256; i++)
        EXPECT_EQ(inverse[table[i]], i);
}

TEST(Tables, DuplicateEntryIsNotBijection)
{
    SBox table = SubstitutionTable::sbox;
    table[1] = table[0];

    EXPECT_FALSE(SubstitutionTable::isBijection(table));
    EXPECT_THROW(SubstitutionTable::validate(table), InvalidTable);
    EXPECT_THROW(SubstitutionTable::invert(table), InvalidTable);
}

TEST(Tables, FromBytesRequires256Entries)
{
    std::vector<uint8_t> bytes(256);
    std::iota(bytes.begin(), bytes.end(), 0);

    SBox identity = SubstitutionTable::fromBytes(bytes);
    EXPECT_EQ(identity[0x42], 0x42);

    EXPECT_THROW(SubstitutionTable::fromBytes(std::vector<uint8_t>(255)), InvalidTable);
    EXPECT_THROW(SubstitutionTable::fromBytes(std::vector<uint8_t>(257)), InvalidTable);
    EXPECT_THROW(SubstitutionTable::fromBytes({}), InvalidTable);
}

TEST(Tables, InvalidTableIsInvalidArgument)
{
    EXPECT_THROW(SubstitutionTable::fromBytes(std::vector<uint8_t>(16)), std::invalid_argument);
}

TEST(Tables, SizeMatchesByteDomain)
{
    static_assert(SubstitutionTable::SIZE == 256);
    EXPECT_EQ(SubstitutionTable::sbox.size(), SubstitutionTable::SIZE);
    EXPECT_EQ(SubstitutionTable::inv_sbox.size(), SubstitutionTable::SIZE);
}
