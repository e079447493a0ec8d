// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                    return "NONE";

        case ErrorCode::PARSE_ERROR:             return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT:        return "PARSE_BAD_FORMAT";

        case ErrorCode::VALIDATION_ERROR:        return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:        return "VALIDATION_RANGE";

        case ErrorCode::CRYPTO_ERROR:            return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:        return "CRYPTO_HASH_FAIL";

        case ErrorCode::CONFIG_ERROR:            return "CONFIG_ERROR";
        case ErrorCode::CONFIG_FILE_MISSING:     return "CONFIG_FILE_MISSING";

        case ErrorCode::POOL_ALREADY_IMPORTED:   return "POOL_ALREADY_IMPORTED";
        case ErrorCode::POOL_CYCLIC_TRANSACTION: return "POOL_CYCLIC_TRANSACTION";
        case ErrorCode::POOL_INVALID_STATE:      return "POOL_INVALID_STATE";

        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: "NAME(code): message [file:line:col]"
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
