#pragma once
#include <stdexcept>
#include <string>

// Block or round key is not exactly 16 bytes.
class InvalidLength : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Number of round keys does not match AES-128/192/256 (11, 13 or 15).
class InvalidKeySchedule : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Substitution table is not 256 entries, or is not a permutation when validated.
class InvalidTable : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
