// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/marker.h"

#include "core/hex.h"

namespace pool {

std::size_t MarkerHash::operator()(const TxMarker& marker) const noexcept {
    std::size_t h = 14695981039346656037ULL;
    for (uint8_t byte : marker) {
        h ^= static_cast<std::size_t>(byte);
        h *= 1099511628211ULL;
    }
    return h;
}

TxMarker to_marker(uint64_t nonce, const core::uint160& sender) {
    TxMarker marker;
    marker.reserve(ACCOUNT_MARKER_SIZE);
    for (int i = 0; i < 8; ++i) {
        marker.push_back(static_cast<uint8_t>(nonce >> (8 * i)));
    }
    marker.insert(marker.end(), sender.bytes().begin(), sender.bytes().end());
    return marker;
}

std::vector<TxMarker> required_markers(uint64_t provided_nonce,
                                       uint64_t on_chain_nonce,
                                       const core::uint160& sender) {
    if (provided_nonce <= on_chain_nonce) {
        return {};
    }
    return {to_marker(provided_nonce - 1, sender)};
}

std::string marker_to_hex(const TxMarker& marker) {
    return core::to_hex(marker);
}

std::string markers_to_string(const std::vector<TxMarker>& markers) {
    std::string out = "{";
    for (std::size_t i = 0; i < markers.size(); ++i) {
        if (i > 0) out += ", ";
        out += marker_to_hex(markers[i]);
    }
    out += "}";
    return out;
}

}  // namespace pool
