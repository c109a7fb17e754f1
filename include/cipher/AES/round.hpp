#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <cipher/AES/block.hpp>
#include <cipher/AES/tables.hpp>

// The four AES round transformations and their inverses.
// Every function takes the state by const reference and returns a new state.
class Round
{
public:
    using State = Block::State;
    using Word = Block::Word;

    // XOR with the round key; applying it twice restores the input.
    static State addRoundKey(const State& st, const State& key);

    // --- forward operations ---
    static State subBytes(const State& st, const SBox& table = SubstitutionTable::sbox);
    static State subBytes(const State& st, const std::vector<uint8_t>& table);

    static Word shiftRow(const Word& row, size_t shift);
    static State shiftRows(const State& st);

    static Word mixColumn(const Word& col);
    static State mixColumns(const State& st);

    // --- inverse operations (for decryption) ---
    static State invSubBytes(const State& st, const SBox& table = SubstitutionTable::inv_sbox);
    static State invSubBytes(const State& st, const std::vector<uint8_t>& table);

    static State invShiftRows(const State& st);

    static Word invMixColumn(const Word& col);
    static State invMixColumns(const State& st);
};
