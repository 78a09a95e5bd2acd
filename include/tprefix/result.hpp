#pragma once

#include <tprefix/error.hpp>
#include <variant>
#include <functional>
#include <utility>

namespace tprefix {

template<typename T, typename E = Error>
class Result {
    std::variant<T, E> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from E so TPREFIX_TRY can return errors across Result<T> types
    Result(E err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(E e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    E& error() & { return std::get<1>(data_); }
    const E& error() const& { return std::get<1>(data_); }
    E&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) {
            return value();
        }
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>())), E> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U, E>::ok(f(value()));
        }
        return Result<U, E>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TPREFIX_TRY(expr) \
    do { \
        auto _tprefix_result = (expr); \
        if (_tprefix_result.is_err()) return std::move(_tprefix_result).error(); \
    } while(0)

} // namespace tprefix
