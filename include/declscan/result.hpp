#pragma once

#include <declscan/error.hpp>
#include <cstddef>
#include <utility>
#include <variant>

namespace declscan {

// Either a value or a DeclscanError. Wrong-side access throws
// std::bad_variant_access.
template<typename T>
class Result {
public:
    // Implicit so a function returning Result<T> can `return DeclscanError{...}`
    Result(DeclscanError err) : state_(std::in_place_index<0>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<1>, std::move(val)); }
    static Result err(DeclscanError e) { return Result(std::move(e)); }

    bool is_ok() const { return state_.index() == 1; }
    bool is_err() const { return state_.index() == 0; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<1>(state_); }
    const T& value() const& { return std::get<1>(state_); }
    T&& value() && { return std::get<1>(std::move(state_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<1>(state_) : std::move(fallback);
    }

    DeclscanError& error() & { return std::get<0>(state_); }
    const DeclscanError& error() const& { return std::get<0>(state_); }
    DeclscanError&& error() && { return std::get<0>(std::move(state_)); }

    // Tag an error with the file it came from; a no-op on success
    Result& at(const std::string& path, int line = 0) & {
        if (is_err()) error().at(path, line);
        return *this;
    }
    Result&& at(const std::string& path, int line = 0) && {
        if (is_err()) error().at(path, line);
        return std::move(*this);
    }

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

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<DeclscanError, T> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early from the enclosing function if expr holds an error
#define DECLSCAN_TRY(expr) \
    do { \
        auto&& _declscan_r = (expr); \
        if (_declscan_r.is_err()) return std::move(_declscan_r).error(); \
    } while (0)

} // namespace declscan
