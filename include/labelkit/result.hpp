#pragma once

#include <labelkit/error.hpp>
#include <variant>
#include <utility>

namespace labelkit {

// Value-or-error return for the fallible edges of the library (config and
// row loading). The render path itself never produces one.
template<typename T>
class Result {
    std::variant<T, LabelError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from LabelError so LABELKIT_TRY can forward errors between
    // Result<T> types.
    Result(LabelError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(LabelError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<LabelError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    LabelError& error() & { return std::get<LabelError>(data_); }
    const LabelError& error() const& { return std::get<LabelError>(data_); }
    LabelError&& error() && { return std::get<LabelError>(std::move(data_)); }

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

#define LABELKIT_TRY(expr) \
    do { \
        auto _labelkit_result = (expr); \
        if (_labelkit_result.is_err()) return std::move(_labelkit_result).error(); \
    } while(0)

} // namespace labelkit
