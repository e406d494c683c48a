#pragma once

#include <clex/error.hpp>
#include <utility>
#include <variant>

namespace clex {

// Either a value or a ClexError. Lexical problems are not errors here:
// they travel as diagnostics. Result carries I/O, usage and fatal-scan
// failures up to the CLI.
template<typename T>
class Result {
    std::variant<T, ClexError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so CLEX_TRY can hand an error to any Result<U>
    Result(ClexError err) : data_(std::move(err)) {}

    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ClexError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ClexError>(data_); }
    bool is_err(ClexError::Code code) const {
        return is_err() && error().code == code;
    }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ClexError& error() & { return std::get<ClexError>(data_); }
    const ClexError& error() const& { return std::get<ClexError>(data_); }
    ClexError&& error() && { return std::get<ClexError>(std::move(data_)); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(f(value()));
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        using R = decltype(f(std::declval<T&>()));
        if (is_err()) return R::err(error());
        return f(value());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) return *this;
        return f(error());
    }
};

// Result of an operation with nothing to return
using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early from the enclosing function if expr is an error
#define CLEX_TRY(expr) \
    do { \
        auto _clex_result = (expr); \
        if (_clex_result.is_err()) return std::move(_clex_result).error(); \
    } while (0)

// Declare `var` holding the value of expr, or return its error
#define CLEX_TRY_ASSIGN(var, expr) \
    auto _clex_##var = (expr); \
    if (_clex_##var.is_err()) return std::move(_clex_##var).error(); \
    auto var = std::move(_clex_##var).value()

} // namespace clex
