#pragma once
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>

struct BenchOptions {
    std::string outFile;
    size_t blocks = 100000;
};

// Block counts are plain decimal digits; signs, blanks and trailing garbage are rejected.
inline size_t parseBlockCount(const std::string& text)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("--blocks expects a positive integer, got '" + text + "'");

    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    }
    catch (const std::out_of_range&) {
        throw std::invalid_argument("--blocks value out of range: " + text);
    }
    if (value == 0)
        throw std::invalid_argument("--blocks must be positive");
    return static_cast<size_t>(value);
}

inline BenchOptions parseBenchArgs(int argc, const char* const* argv)
{
    BenchOptions opts;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            opts.outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--blocks") == 0 && i + 1 < argc) {
            opts.blocks = parseBlockCount(argv[++i]);
        } else {
            throw std::invalid_argument(std::string("unknown or incomplete argument: ") + argv[i]);
        }
    }
    return opts;
}
