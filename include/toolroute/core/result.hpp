#pragma once

#include "errors.hpp"

#include <optional>
#include <stdexcept>
#include <variant>

namespace toolroute::core {

namespace detail {

[[noreturn]] inline void bad_result_access(const char* what) {
    throw std::logic_error(what);
}

}  // namespace detail

// Value or Error. Implicitly constructible from either so functions can
// `return value;` or `return Error{...};`
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    template<typename... Args>
    static Result err(ErrorCode code, Args&&... args) {
        return Result(E{code, std::forward<Args>(args)...});
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(checked_value()); }
    const T& value() const& { return std::get<0>(checked_value()); }
    T&& value() && { return std::get<0>(std::move(checked_value())); }

    E& error() & { return std::get<1>(checked_error()); }
    const E& error() const& { return std::get<1>(checked_error()); }
    E&& error() && { return std::get<1>(std::move(checked_error())); }

private:
    using Storage = std::variant<T, E>;

    Storage& checked_value() {
        if (!is_ok()) detail::bad_result_access("value() on an error result");
        return data_;
    }
    const Storage& checked_value() const {
        if (!is_ok()) detail::bad_result_access("value() on an error result");
        return data_;
    }
    Storage& checked_error() {
        if (!is_err()) detail::bad_result_access("error() on an ok result");
        return data_;
    }
    const Storage& checked_error() const {
        if (!is_err()) detail::bad_result_access("error() on an ok result");
        return data_;
    }

    Storage data_;
};

// Success carries nothing
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    template<typename... Args>
    static Result err(ErrorCode code, Args&&... args) {
        return Result(E{code, std::forward<Args>(args)...});
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    E& error() & { return checked_error(); }
    const E& error() const& {
        if (!error_) detail::bad_result_access("error() on an ok result");
        return *error_;
    }
    E&& error() && { return std::move(checked_error()); }

private:
    E& checked_error() {
        if (!error_) detail::bad_result_access("error() on an ok result");
        return *error_;
    }

    std::optional<E> error_;
};

template<typename T>
using KResult = Result<T, Error>;

using Status = Result<void, Error>;

// Propagate the error of a Result<void> out of the enclosing function
#define TOOLROUTE_TRY_VOID(expr) \
    do { \
        auto&& _status = (expr); \
        if (_status.is_err()) { \
            return std::move(_status).error(); \
        } \
    } while (0)

}  // namespace toolroute::core
