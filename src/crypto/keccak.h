#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Keccak-256 (SHA3-256) over the OpenSSL 3.0+ EVP API.
//
// The "keccak256" naming follows the account-model convention; the
// primitive is NIST SHA3-256 (FIPS 202). Digest failures throw
// std::runtime_error.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// One-shot SHA3-256 of a byte span.
[[nodiscard]] core::uint256 keccak256(std::span<const uint8_t> data);

/// Streaming SHA3-256. Feed fields with the write_* helpers, then call
/// finalize() once; reset() makes the hasher reusable.
class Keccak256Hasher {
public:
    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;
    Keccak256Hasher(Keccak256Hasher&&) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&&) noexcept;

    Keccak256Hasher& write(std::span<const uint8_t> data);

    /// 8 bytes, little-endian.
    Keccak256Hasher& write_u64(uint64_t v);

    /// 4-byte little-endian length prefix followed by the bytes.
    Keccak256Hasher& write_sized(std::span<const uint8_t> data);

    [[nodiscard]] core::uint256 finalize();

    void reset();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finalized_ = false;
};

}  // namespace crypto
