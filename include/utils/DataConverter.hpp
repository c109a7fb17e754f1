#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

class DataConverter {
public:
    // BYTES <-> HEX

    static std::vector<uint8_t> HexToBytes(const std::string& hex) {
        if (hex.size() % 2 != 0)
            throw std::invalid_argument("HexToBytes: hex length must be even");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);

        for (std::size_t i = 0; i < hex.size(); i += 2) {
            uint8_t high = HexCharToValue(hex[i]);
            uint8_t low = HexCharToValue(hex[i + 1]);
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }
        return bytes;
    }

    // Same as HexToBytes but skips whitespace, ':' and '-' separators and an optional 0x prefix
    static std::vector<uint8_t> LooseHexToBytes(const std::string& text) {
        std::string hex;
        hex.reserve(text.size());

        std::size_t start = 0;
        if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            start = 2;

        for (std::size_t i = start; i < text.size(); i++) {
            char c = text[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ':' || c == '-')
                continue;
            hex.push_back(c);
        }
        return HexToBytes(hex);
    }

    static std::string BytesToHex(const std::vector<uint8_t>& bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);

        for (uint8_t b : bytes) {
            out.push_back(ValueToHexChar(b >> 4));
            out.push_back(ValueToHexChar(b));
        }
        return out;
    }

private:
    static uint8_t HexCharToValue(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument(std::string("Invalid hex character: '") + c + "'");
    }

    static char ValueToHexChar(uint8_t v) {
        static const char* hex = "0123456789abcdef";
        return hex[v & 0x0F];
    }
};
