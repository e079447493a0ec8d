// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

#include <array>

namespace core {

namespace {

// byte -> two lowercase ASCII digits
constexpr std::array<char, 512> make_encode_table() {
    constexpr char digits[] = "0123456789abcdef";
    std::array<char, 512> table{};
    for (int i = 0; i < 256; ++i) {
        table[static_cast<size_t>(i) * 2]     = digits[(i >> 4) & 0xF];
        table[static_cast<size_t>(i) * 2 + 1] = digits[i & 0xF];
    }
    return table;
}

// ASCII -> nibble, 0xFF for invalid
constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

constexpr auto ENCODE_TABLE = make_encode_table();
constexpr auto DECODE_TABLE = make_decode_table();

}  // namespace

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.resize(data.size() * 2);
    char* out = result.data();
    for (uint8_t byte : data) {
        const size_t idx = static_cast<size_t>(byte) * 2;
        *out++ = ENCODE_TABLE[idx];
        *out++ = ENCODE_TABLE[idx + 1];
    }
    return result;
}

std::string_view strip_hex_prefix(std::string_view hex) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(hex[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(hex[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char ch : str) {
        if (DECODE_TABLE[static_cast<uint8_t>(ch)] == 0xFF) {
            return false;
        }
    }
    return true;
}

}  // namespace core
