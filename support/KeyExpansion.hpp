#pragma once
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "cipher/AES/keySchedule.hpp"
#include "cipher/AES/tables.hpp"

// FIPS-197 key expansion (AES-128/192/256). Stands in for the key-expansion
// collaborator that feeds round keys to the cipher core.
class KeyExpansion
{
public:
    // Raw round keys, FIPS-197 byte order, Nr + 1 entries.
    static std::vector<std::vector<uint8_t>> roundKeys(const std::vector<uint8_t>& key)
    {
        if (key.size() != 16 && key.size() != 24 && key.size() != 32)
        {
            throw std::invalid_argument("AES key must be 16, 24, or 32 bytes");
        }

        const int Nb = 4;
        const int Nk = static_cast<int>(key.size()) / 4; // 4, 6, 8
        const int Nr = Nk + 6;                           // 10, 12, 14
        const int totalWords = Nb * (Nr + 1);            // 44, 52, 60

        uint8_t w[60][4];

        for (int i = 0; i < Nk; ++i)
        {
            w[i][0] = key[4 * i + 0];
            w[i][1] = key[4 * i + 1];
            w[i][2] = key[4 * i + 2];
            w[i][3] = key[4 * i + 3];
        }

        for (int i = Nk; i < totalWords; ++i)
        {
            uint8_t temp[4] = { w[i - 1][0], w[i - 1][1], w[i - 1][2], w[i - 1][3] };

            if (i % Nk == 0)
            {
                rotWord(temp);
                subWord(temp);
                temp[0] ^= Rcon(i / Nk);
            }
            else if (Nk > 6 && (i % Nk) == 4)
            {
                subWord(temp);
            }

            for (int j = 0; j < 4; ++j)
                w[i][j] = w[i - Nk][j] ^ temp[j];
        }

        std::vector<std::vector<uint8_t>> out(Nr + 1, std::vector<uint8_t>(16));
        for (int r = 0; r <= Nr; ++r)
            for (int c = 0; c < Nb; ++c)
                for (int j = 0; j < 4; ++j)
                    out[r][4 * c + j] = w[4 * r + c][j];
        return out;
    }

    static KeySchedule schedule(const std::vector<uint8_t>& key)
    {
        return KeySchedule::fromRoundKeys(roundKeys(key));
    }

    // Round keys concatenated, as the CLI's --schedule option takes them.
    static std::vector<uint8_t> flat(const std::vector<uint8_t>& key)
    {
        std::vector<uint8_t> out;
        for (const auto& rk : roundKeys(key))
            out.insert(out.end(), rk.begin(), rk.end());
        return out;
    }

private:
    static uint8_t Rcon(int i)
    {
        static const uint8_t rcon[11] = {
            0x00,
            0x01, 0x02, 0x04, 0x08, 0x10,
            0x20, 0x40, 0x80, 0x1B, 0x36 };
        return rcon[i];
    }

    static void rotWord(uint8_t* w)
    {
        uint8_t tmp = w[0];
        w[0] = w[1];
        w[1] = w[2];
        w[2] = w[3];
        w[3] = tmp;
    }

    static void subWord(uint8_t* w)
    {
        for (int i = 0; i < 4; i++)
            w[i] = SubstitutionTable::sbox[w[i]];
    }
};
