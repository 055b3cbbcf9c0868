#pragma once

#include <stencil/error.hpp>
#include <variant>
#include <functional>

namespace stencil {

template<typename T>
class Result {
    std::variant<T, StencilError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from StencilError so STENCIL_TRY can return errors across Result<T> types
    Result(StencilError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StencilError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StencilError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StencilError& error() & { return std::get<StencilError>(data_); }
    const StencilError& error() const& { return std::get<StencilError>(data_); }
    StencilError&& error() && { return std::get<StencilError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STENCIL_TRY(expr) \
    do { \
        auto _stencil_result = (expr); \
        if (_stencil_result.is_err()) return std::move(_stencil_result).error(); \
    } while(0)

} // namespace stencil
