#include "infrastructure/Base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace voicescribe::infrastructure {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kInvalid = -1;

std::array<int, 256> BuildDecodeTable() {
    std::array<int, 256> table{};
    table.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    table[static_cast<unsigned char>('-')] = 62;
    table[static_cast<unsigned char>('_')] = 63;
    return table;
}

} // namespace

std::string Base64::Encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < bytes.size(); i += 3) {
        std::uint32_t triple = static_cast<unsigned char>(bytes[i]) << 16;
        if (i + 1 < bytes.size()) triple |= static_cast<unsigned char>(bytes[i + 1]) << 8;
        if (i + 2 < bytes.size()) triple |= static_cast<unsigned char>(bytes[i + 2]);

        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += (i + 1 < bytes.size()) ? kAlphabet[(triple >> 6) & 0x3F] : '=';
        out += (i + 2 < bytes.size()) ? kAlphabet[triple & 0x3F] : '=';
    }
    return out;
}

std::optional<std::string> Base64::Decode(const std::string& text) {
    static const std::array<int, 256> table = BuildDecodeTable();

    std::string out;
    out.reserve((text.size() / 4) * 3);

    std::uint32_t accumulator = 0;
    int bits = 0;
    int quantum = 0;
    bool padding = false;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            padding = true;
            continue;
        }
        // Data after padding is not part of a valid encoding.
        if (padding) {
            return std::nullopt;
        }
        int value = table[c];
        if (value == kInvalid) {
            return std::nullopt;
        }

        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        quantum = (quantum + 1) % 4;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((accumulator >> bits) & 0xFF));
        }
    }

    // A single leftover sextet cannot encode a byte.
    if (quantum == 1) {
        return std::nullopt;
    }
    return out;
}

} // namespace voicescribe::infrastructure
