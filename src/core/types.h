#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size opaque byte string
// ---------------------------------------------------------------------------
// Base template for uint256 (N=32, digests) and uint160 (N=20, account
// addresses). Bytes are kept in wire order: index 0 is the first byte of the
// digest or address and the first pair of hex digits in to_hex().
// Ordering is lexicographic over the bytes.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse exactly 2*N hex digits, optional "0x" prefix.
    /// Throws std::invalid_argument on malformed input.
    static Blob from_hex(std::string_view hex);

    /// 2*N lower-case hex digits, no prefix.
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept {
        return bytes_ <=> other.bytes_;
    }
    [[nodiscard]] bool operator==(const Blob& other) const noexcept {
        return bytes_ == other.bytes_;
    }

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 32-byte digest (transaction hashes)
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    static uint256 from_hex(std::string_view hex);
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
};

// ---------------------------------------------------------------------------
// uint160 -- 20-byte account address
// ---------------------------------------------------------------------------
class uint160 : public Blob<20> {
public:
    using Blob<20>::Blob;

    static uint160 from_hex(std::string_view hex);
    static uint160 from_bytes(std::span<const uint8_t, 20> bytes) noexcept;
};

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};

template <>
struct std::hash<core::uint160> {
    std::size_t operator()(const core::uint160& v) const noexcept;
};
