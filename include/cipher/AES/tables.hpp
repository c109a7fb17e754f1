#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

using SBox = std::array<uint8_t, 256>;

class SubstitutionTable
{
public:
    static constexpr size_t SIZE = 256;

    // --- S-box ---
    static const SBox sbox;
    // --- Inverse S-box ---
    static const SBox inv_sbox;

    // Copies caller data into a table, throws InvalidTable unless exactly 256 bytes.
    static SBox fromBytes(const std::vector<uint8_t>& bytes);

    static bool isBijection(const SBox& table);

    // Throws InvalidTable if the table is not a permutation of 0..255.
    static void validate(const SBox& table);

    static SBox invert(const SBox& table);
};
