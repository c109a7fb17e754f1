#include "cipher/AES/block.hpp"
#include "cipher/AES/errors.hpp"

#include <algorithm>

void Block::requireSize(size_t size, const std::string& what)
{
    if (size != SIZE)
    {
        throw InvalidLength(what + " must be 16 bytes. Got: " + std::to_string(size) + " bytes");
    }
}

Block::State Block::fromBytes(const std::vector<uint8_t>& bytes)
{
    requireSize(bytes.size(), "Block");
    return fromBytes(bytes.data());
}

Block::State Block::fromBytes(const uint8_t* in)
{
    State st{};
    for (size_t n = 0; n < SIZE; n++)
        st[COLUMNS * (n % ROWS) + n / ROWS] = in[n];
    return st;
}

std::vector<uint8_t> Block::toBytes(const State& st)
{
    std::vector<uint8_t> out(SIZE);
    toBytes(st, out.data());
    return out;
}

void Block::toBytes(const State& st, uint8_t* out)
{
    for (size_t n = 0; n < SIZE; n++)
        out[n] = st[COLUMNS * (n % ROWS) + n / ROWS];
}

Block::State Block::fromMatrix(const std::vector<uint8_t>& bytes)
{
    requireSize(bytes.size(), "Block");
    State st{};
    std::copy(bytes.begin(), bytes.end(), st.begin());
    return st;
}

Block::Word Block::row(const State& st, size_t r)
{
    return { st[4 * r], st[4 * r + 1], st[4 * r + 2], st[4 * r + 3] };
}

Block::Word Block::column(const State& st, size_t c)
{
    return { st[c], st[4 + c], st[8 + c], st[12 + c] };
}

void Block::setRow(State& st, size_t r, const Word& w)
{
    for (size_t c = 0; c < COLUMNS; c++)
        st[4 * r + c] = w[c];
}

void Block::setColumn(State& st, size_t c, const Word& w)
{
    for (size_t r = 0; r < ROWS; r++)
        st[4 * r + c] = w[r];
}
