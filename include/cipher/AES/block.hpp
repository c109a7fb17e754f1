#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// The 16-byte AES state viewed as a 4x4 matrix stored row-major:
// state[4 * r + c] is row r, column c.
//
// Raw bytes coming from outside (plaintext, ciphertext, round keys) follow
// the FIPS-197 input order, where byte n belongs to row n % 4, column n / 4.
// fromBytes/toBytes translate between the two.
class Block
{
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t ROWS = 4;
    static constexpr size_t COLUMNS = 4;

    using State = std::array<uint8_t, SIZE>;
    using Word = std::array<uint8_t, 4>;

    static State fromBytes(const std::vector<uint8_t>& bytes);
    static State fromBytes(const uint8_t* in);
    static std::vector<uint8_t> toBytes(const State& st);
    static void toBytes(const State& st, uint8_t* out);

    // Takes bytes already laid out row-major, no reordering.
    static State fromMatrix(const std::vector<uint8_t>& bytes);

    static Word row(const State& st, size_t r);
    static Word column(const State& st, size_t c);
    static void setRow(State& st, size_t r, const Word& w);
    static void setColumn(State& st, size_t c, const Word& w);

    // Throws InvalidLength naming `what` unless size == 16.
    static void requireSize(size_t size, const std::string& what);
};
