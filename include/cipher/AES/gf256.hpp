#pragma once
#include <cstdint>

// Arithmetic in GF(2^8) modulo x^8 + x^4 + x^3 + x + 1 (0x11B)
class GF256
{
public:
    static constexpr uint8_t REDUCTION = 0x1b;

    // multiply by x (i.e. by 2)
    static uint8_t xtime(uint8_t b);

    // shift-and-add multiply built on xtime
    static uint8_t mul(uint8_t a, uint8_t b);
};
