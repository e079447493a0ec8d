#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the Sluice stack
enum class ErrorCode : uint16_t {
    NONE                    = 0,
    // Parsing (100-199)
    PARSE_ERROR             = 100, PARSE_BAD_FORMAT = 101,
    // Validation (200-299)
    VALIDATION_ERROR        = 200, VALIDATION_RANGE = 201,
    // Cryptography (400-499)
    CRYPTO_ERROR            = 400, CRYPTO_HASH_FAIL = 401,
    // Configuration (500-599)
    CONFIG_ERROR            = 500, CONFIG_FILE_MISSING = 501,
    // Transaction pool (800-899)
    POOL_ALREADY_IMPORTED   = 800,
    POOL_CYCLIC_TRANSACTION = 801,
    POOL_INVALID_STATE      = 802,
    // Internal (900-999)
    INTERNAL_ERROR          = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

private:
    std::variant<T, E> storage_;
};

// Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// SLUICE_TRY_ASSIGN: bind the value of a Result or return its error
// Usage:  SLUICE_TRY_ASSIGN(val, some_result_expr);
#define SLUICE_TRY_ASSIGN(var, expr)                                      \
    auto _sluice_tmp_##var = (expr);                                      \
    if (!_sluice_tmp_##var.ok())                                          \
        return std::move(_sluice_tmp_##var).error();                      \
    auto var = std::move(_sluice_tmp_##var).value()

// SLUICE_TRY_VOID: propagate errors from Result<void> expressions
#define SLUICE_TRY_VOID(expr)                                             \
    do {                                                                  \
        auto _sluice_tmp = (expr);                                        \
        if (!_sluice_tmp.ok()) return std::move(_sluice_tmp).error();     \
    } while (false)

} // namespace core
