#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
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

// ErrorCode: categorized error codes for the dynfee stack
enum class ErrorCode : uint16_t {
    NONE                    = 0,
    // Validation / policy (200-299)
    VALIDATION_ERROR        = 200, VALIDATION_RANGE = 201,
    // Oracle (300-399)
    ORACLE_ERROR            = 300, ORACLE_NOT_ENABLED    = 301,
    ORACLE_ALREADY_ENABLED  = 302, ORACLE_STALE_LOOKBACK = 303,
    // Fee controller (400-499)
    FEE_ERROR               = 400, FEE_NOT_INITIALIZED     = 401,
    FEE_ALREADY_INITIALIZED = 402,
    // Authorization (500-599)
    AUTH_ERROR              = 500, AUTH_UNAUTHORIZED = 501,
    // Configuration (600-699)
    CONFIG_ERROR            = 600, CONFIG_PARSE = 601,
    // Internal (900-999)
    INTERNAL_ERROR          = 900, NOT_IMPLEMENTED = 901,
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
    [[nodiscard]] explicit operator bool() const noexcept {
        return code_ != ErrorCode::NONE;
    }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
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

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
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

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

/// True when @p res holds an error carrying @p code.
template <typename R>
[[nodiscard]] bool has_error_code(const R& res, ErrorCode code) {
    return !res.ok() && res.error().code() == code;
}

// DYNFEE_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = DYNFEE_TRY(some_result_expr);
#define DYNFEE_TRY(expr)                                                  \
    ({                                                                    \
        auto&& _dynfee_res = (expr);                                      \
        if (!_dynfee_res.ok()) return std::move(_dynfee_res).error();     \
        std::move(_dynfee_res).value();                                   \
    })

// DYNFEE_TRY_ASSIGN: MSVC-compatible alternative (no statement-expressions)
// Usage:  DYNFEE_TRY_ASSIGN(val, some_result_expr);
#define DYNFEE_TRY_ASSIGN(var, expr)                                      \
    auto _dynfee_tmp_##var = (expr);                                      \
    if (!_dynfee_tmp_##var.ok())                                          \
        return std::move(_dynfee_tmp_##var).error();                      \
    auto var = std::move(_dynfee_tmp_##var).value()

// DYNFEE_TRY_VOID: propagate errors from Result<void> expressions
#define DYNFEE_TRY_VOID(expr)                                             \
    do {                                                                  \
        auto _dynfee_tmp = (expr);                                        \
        if (!_dynfee_tmp.ok()) return std::move(_dynfee_tmp).error();     \
    } while (false)

} // namespace core
