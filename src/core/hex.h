#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. An optional "0x"/"0X" prefix is
// accepted. Returns nullopt on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Even length and every character in [0-9a-fA-F].
bool is_hex(std::string_view str);

// Removes a leading "0x" / "0X", if any.
std::string_view strip_hex_prefix(std::string_view hex) noexcept;

}  // namespace core
