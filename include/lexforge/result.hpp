#pragma once

#include <lexforge/error.hpp>
#include <variant>
#include <functional>
#include <utility>

namespace lexforge {

// Value-or-error. E defaults to LexError; the tokenizer instantiates it with
// the full list of scan diagnostics instead.
template<typename T, typename E = LexError>
class Result {
    std::variant<T, E> data_;

    explicit Result(T val) : data_(std::in_place_index<0>, std::move(val)) {}

public:
    // Implicit from E so LEXFORGE_TRY can return errors across Result<T> types
    Result(E err) : data_(std::in_place_index<1>, std::move(err)) {}
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

#define LEXFORGE_TRY(expr) \
    do { \
        auto _lexforge_result = (expr); \
        if (_lexforge_result.is_err()) return std::move(_lexforge_result).error(); \
    } while(0)

} // namespace lexforge
