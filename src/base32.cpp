#include "base32.h"
#include <cstdint>

namespace kaddht {

namespace {

const char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int base32_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

} // namespace

std::string base32_encode(const std::string& data) {
    std::string result;
    result.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : data) {
        buffer = (buffer << 8) | c;
        bits += 8;
        while (bits >= 5) {
            result += BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F];
            bits -= 5;
        }
    }
    if (bits > 0) {
        result += BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F];
    }
    return result;
}

std::optional<std::string> base32_decode(const std::string& text) {
    // 1, 3 and 6 trailing characters cannot come from whole bytes
    size_t tail = text.size() % 8;
    if (tail == 1 || tail == 3 || tail == 6) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int value = base32_value(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            result += static_cast<char>((buffer >> (bits - 8)) & 0xFF);
            bits -= 8;
        }
    }

    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

} // namespace kaddht
