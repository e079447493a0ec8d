#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Dependency markers.
//
// A marker is an opaque byte string. A transaction "provides" markers and
// "requires" markers; it is ready once every required marker is provided by
// a ready transaction or by chain state. The pool never interprets marker
// bytes. For account-model transactions the canonical marker is
// (nonce, sender): 8 bytes little-endian nonce followed by the 20 address
// bytes.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pool {

using TxMarker = std::vector<uint8_t>;

/// FNV-1a over the marker bytes.
struct MarkerHash {
    std::size_t operator()(const TxMarker& marker) const noexcept;
};

using MarkerSet = std::unordered_set<TxMarker, MarkerHash>;

template <typename V>
using MarkerMap = std::unordered_map<TxMarker, V, MarkerHash>;

/// Size of a marker produced by to_marker().
inline constexpr std::size_t ACCOUNT_MARKER_SIZE = 8 + core::uint160::SIZE;

[[nodiscard]] TxMarker to_marker(uint64_t nonce, const core::uint160& sender);

/// Markers a transaction with @p provided_nonce must wait for, given the
/// sender's nonce in chain state:
///   - nonce equal to the on-chain nonce: nothing, it is next in line;
///   - nonce ahead of the on-chain nonce: the marker of nonce - 1;
///   - nonce behind the on-chain nonce: nothing (stale nonces are rejected
///     upstream, not held here).
[[nodiscard]] std::vector<TxMarker> required_markers(
    uint64_t provided_nonce, uint64_t on_chain_nonce,
    const core::uint160& sender);

[[nodiscard]] std::string marker_to_hex(const TxMarker& marker);

/// "{aa.., bb..}"
[[nodiscard]] std::string markers_to_string(const std::vector<TxMarker>& markers);

}  // namespace pool
