// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

// FNV-1a, 64-bit. Not cryptographic; only used for hash-table buckets.
template <std::size_t N>
std::size_t fnv1a(const std::array<uint8_t, N>& bytes) noexcept {
    std::size_t h = 14695981039346656037ULL;
    for (auto byte : bytes) {
        h ^= static_cast<std::size_t>(byte);
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace

// ===========================================================================
// Blob<N>
// ===========================================================================

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() != N * 2) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(N * 2) +
            " hex chars, got " + std::to_string(hex.size()));
    }
    auto decoded = core::from_hex(hex);
    if (!decoded) {
        throw std::invalid_argument("Blob::from_hex: invalid hex character");
    }
    Blob<N> result;
    std::copy(decoded->begin(), decoded->end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    return core::to_hex(std::span<const uint8_t>(bytes_));
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template class Blob<32>;
template class Blob<20>;

// ===========================================================================
// uint256 / uint160 factories
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_hex(hex);
    return result;
}

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes(bytes);
    return result;
}

uint160 uint160::from_hex(std::string_view hex) {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_hex(hex);
    return result;
}

uint160 uint160::from_bytes(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes(bytes);
    return result;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    return core::fnv1a(v.bytes());
}

std::size_t std::hash<core::uint160>::operator()(
    const core::uint160& v) const noexcept {
    return core::fnv1a(v.bytes());
}
