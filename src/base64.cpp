#include "base64.hpp"

#include <array>
#include <cstdint>

namespace vidcount {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_decode_table() {
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

} // namespace

std::string base64_encode(const unsigned char* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= size) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8) |
                           static_cast<uint32_t>(data[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
        i += 3;
    }

    const size_t rest = size - i;
    if (rest == 1) {
        const uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string base64_encode(const std::vector<unsigned char>& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<std::vector<unsigned char>> base64_decode(const std::string& text) {
    static const std::array<int, 256> table = make_decode_table();

    std::vector<unsigned char> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    int padding = 0;
    size_t symbols = 0;

    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        // Data after padding
        if (padding > 0) return std::nullopt;

        const int value = table[static_cast<unsigned char>(c)];
        if (value < 0) return std::nullopt;

        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>((buffer >> bits) & 0xFF));
        }
    }

    if (symbols % 4 != 0 || padding > 2) return std::nullopt;
    return out;
}

} // namespace vidcount
