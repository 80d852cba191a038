#include "ferry/core/base64.hpp"

#include <array>

namespace ferry {
namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_decode_table() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

} // namespace

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<std::uint32_t>(data[i + 2]);

        result += kAlphabet[(n >> 18) & 0x3F];
        result += kAlphabet[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? kAlphabet[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? kAlphabet[n & 0x3F] : '=';
    }

    return result;
}

std::string base64_encode(const std::string& data) {
    return base64_encode(std::vector<std::uint8_t>(data.begin(), data.end()));
}

std::vector<std::uint8_t> base64_decode(const std::string& encoded) {
    static const auto table = make_decode_table();

    std::vector<std::uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    std::uint32_t bits = 0;
    int bit_count = 0;
    for (char c : encoded) {
        if (c == '=') break;
        const int val = table[static_cast<unsigned char>(c)];
        if (val < 0) continue;

        bits = ((bits << 6) | static_cast<std::uint32_t>(val)) & 0xFFFFFF;
        bit_count += 6;
        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<std::uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

} // namespace ferry
