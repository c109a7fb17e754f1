#include "cipher/AES/round.hpp"
#include "cipher/AES/gf256.hpp"

Round::State Round::addRoundKey(const State& st, const State& key)
{
    State out{};
    for (size_t i = 0; i < Block::SIZE; i++)
        out[i] = st[i] ^ key[i];
    return out;
}

Round::State Round::subBytes(const State& st, const SBox& table)
{
    State out{};
    for (size_t i = 0; i < Block::SIZE; i++)
        out[i] = table[st[i]];
    return out;
}

Round::State Round::subBytes(const State& st, const std::vector<uint8_t>& table)
{
    return subBytes(st, SubstitutionTable::fromBytes(table));
}

Round::State Round::invSubBytes(const State& st, const SBox& table)
{
    // same lookup, the caller hands in the inverse table
    return subBytes(st, table);
}

Round::State Round::invSubBytes(const State& st, const std::vector<uint8_t>& table)
{
    return subBytes(st, SubstitutionTable::fromBytes(table));
}

// Cyclic left rotation.
Round::Word Round::shiftRow(const Word& row, size_t shift)
{
    Word out{};
    for (size_t i = 0; i < 4; i++)
        out[i] = row[(i + shift) % 4];
    return out;
}

Round::State Round::shiftRows(const State& st)
{
    State out{};
    for (size_t r = 0; r < Block::ROWS; r++)
        Block::setRow(out, r, shiftRow(Block::row(st, r), r));
    return out;
}

Round::State Round::invShiftRows(const State& st)
{
    State out{};
    for (size_t r = 0; r < Block::ROWS; r++)
        Block::setRow(out, r, shiftRow(Block::row(st, r), (4 - r) % 4));
    return out;
}

Round::Word Round::mixColumn(const Word& col)
{
    const uint8_t a0 = col[0], a1 = col[1], a2 = col[2], a3 = col[3];
    const uint8_t x0 = GF256::xtime(a0), x1 = GF256::xtime(a1),
                  x2 = GF256::xtime(a2), x3 = GF256::xtime(a3);

    return {
        static_cast<uint8_t>(x0 ^ (x1 ^ a1) ^ a2 ^ a3),
        static_cast<uint8_t>(a0 ^ x1 ^ (x2 ^ a2) ^ a3),
        static_cast<uint8_t>(a0 ^ a1 ^ x2 ^ (x3 ^ a3)),
        static_cast<uint8_t>((x0 ^ a0) ^ a1 ^ a2 ^ x3)
    };
}

Round::Word Round::invMixColumn(const Word& col)
{
    const uint8_t a0 = col[0], a1 = col[1], a2 = col[2], a3 = col[3];

    return {
        static_cast<uint8_t>(GF256::mul(a0, 14) ^ GF256::mul(a1, 11) ^ GF256::mul(a2, 13) ^ GF256::mul(a3, 9)),
        static_cast<uint8_t>(GF256::mul(a0, 9) ^ GF256::mul(a1, 14) ^ GF256::mul(a2, 11) ^ GF256::mul(a3, 13)),
        static_cast<uint8_t>(GF256::mul(a0, 13) ^ GF256::mul(a1, 9) ^ GF256::mul(a2, 14) ^ GF256::mul(a3, 11)),
        static_cast<uint8_t>(GF256::mul(a0, 11) ^ GF256::mul(a1, 13) ^ GF256::mul(a2, 9) ^ GF256::mul(a3, 14))
    };
}

Round::State Round::mixColumns(const State& st)
{
    State out{};
    for (size_t c = 0; c < Block::COLUMNS; c++)
        Block::setColumn(out, c, mixColumn(Block::column(st, c)));
    return out;
}

Round::State Round::invMixColumns(const State& st)
{
    State out{};
    for (size_t c = 0; c < Block::COLUMNS; c++)
        Block::setColumn(out, c, invMixColumn(Block::column(st, c)));
    return out;
}
