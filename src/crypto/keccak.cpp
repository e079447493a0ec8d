// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <array>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

void init_ctx(EVP_MD_CTX* ctx, const char* who) {
    if (EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error(std::string(who) +
                                 ": EVP_DigestInit_ex() failed");
    }
}

}  // namespace

core::uint256 keccak256(std::span<const uint8_t> data) {
    Keccak256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

// ===================================================================
// Keccak256Hasher
// ===================================================================

void Keccak256Hasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Keccak256Hasher::Keccak256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_MD_CTX_new() allocation failed");
    }
    init_ctx(ctx_.get(), "Keccak256Hasher");
}

Keccak256Hasher::~Keccak256Hasher() = default;
Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&&) noexcept = default;
Keccak256Hasher& Keccak256Hasher::operator=(Keccak256Hasher&&) noexcept = default;

Keccak256Hasher& Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

Keccak256Hasher& Keccak256Hasher::write_u64(uint64_t v) {
    std::array<uint8_t, 8> buf{};
    for (size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return write(buf);
}

Keccak256Hasher& Keccak256Hasher::write_sized(std::span<const uint8_t> data) {
    const auto len = static_cast<uint32_t>(data.size());
    std::array<uint8_t, 4> prefix{
        static_cast<uint8_t>(len), static_cast<uint8_t>(len >> 8),
        static_cast<uint8_t>(len >> 16), static_cast<uint8_t>(len >> 24)};
    write(prefix);
    return write(data);
}

core::uint256 Keccak256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    std::array<uint8_t, 32> buf{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), buf.data(), &digest_len) != 1 ||
        digest_len != buf.size()) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(buf));
}

void Keccak256Hasher::reset() {
    if (!ctx_) {
        ctx_.reset(EVP_MD_CTX_new());
        if (!ctx_) {
            throw std::runtime_error(
                "Keccak256Hasher::reset(): EVP_MD_CTX_new() allocation failed");
        }
    }
    init_ctx(ctx_.get(), "Keccak256Hasher::reset()");
    finalized_ = false;
}

}  // namespace crypto
