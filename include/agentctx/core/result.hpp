#pragma once

#include "errors.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace agentctx::core {

// Value-or-error return type for fallible operations
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    static Result<T, E> ok(T value) {
        return Result<T, E>(std::move(value));
    }

    static Result<T, E> err(E error) {
        return Result<T, E>(std::move(error));
    }

    static Result<T, E> err(ErrorCode code) {
        return Result<T, E>(E{code});
    }

    static Result<T, E> err(ErrorCode code, std::string message) {
        return Result<T, E>(E{code, std::move(message)});
    }

    static Result<T, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<T, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<T>(std::move(data_));
    }

    E& error() & {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<E>(data_);
    }

    E&& error() && {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<E>(std::move(data_));
    }

    const T* operator->() const {
        return is_ok() ? &std::get<T>(data_) : nullptr;
    }

    T unwrap_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void value
template<typename E>
class Result<void, E> {
public:
    Result() : has_error_(false) {}
    Result(const E& error) : error_(error), has_error_(true) {}
    Result(E&& error) : error_(std::move(error)), has_error_(true) {}

    static Result<void, E> ok() {
        return Result<void, E>();
    }

    static Result<void, E> err(E error) {
        return Result<void, E>(std::move(error));
    }

    static Result<void, E> err(ErrorCode code) {
        return Result<void, E>(E{code});
    }

    static Result<void, E> err(ErrorCode code, std::string message) {
        return Result<void, E>(E{code, std::move(message)});
    }

    static Result<void, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<void, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !has_error_; }
    bool is_err() const { return has_error_; }
    explicit operator bool() const { return is_ok(); }

    const E& error() const& {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return error_;
    }

    E&& error() && {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::move(error_);
    }

private:
    E error_;
    bool has_error_;
};

}  // namespace agentctx::core
