#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace promptshield::base64 {

namespace detail {

inline constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/// Sextet value of a standard or URL-safe alphabet character, or -1
inline int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace detail

inline std::string encode(std::string_view data) {
    std::string out;
    out.reserve(4 * ((data.size() + 2) / 3));
    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        out += detail::kAlphabet[(n >> 18) & 0x3F];
        out += detail::kAlphabet[(n >> 12) & 0x3F];
        out += (i + 1 < data.size()) ? detail::kAlphabet[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < data.size()) ? detail::kAlphabet[n & 0x3F] : '=';
    }
    return out;
}

/**
 * @brief Strict decode of one token (standard or URL-safe alphabet)
 *
 * Padding is only accepted at the end. Returns nullopt on any other
 * character or on a length that cannot be valid base64.
 */
inline std::optional<std::string> decode(std::string_view token) {
    while (!token.empty() && token.back() == '=') token.remove_suffix(1);
    if (token.size() % 4 == 1) return std::nullopt;

    std::string out;
    out.reserve(3 * token.size() / 4);
    uint32_t buf = 0;
    int bits = 0;
    for (const char c : token) {
        const int v = detail::sextet(c);
        if (v < 0) return std::nullopt;
        buf = (buf << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return out;
}

} // namespace promptshield::base64
