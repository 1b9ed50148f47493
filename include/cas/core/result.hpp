#pragma once

/// @file result.hpp
/// @brief Result<T,E> value-or-error type used by every fallible operation.

#include <utility>
#include <variant>

namespace cas {

/// Holds either a success value of type T or an error of type E.
///
/// Auth components never throw for bad input; they return a Result and
/// leave the decision of how to surface the failure to the caller.
///
/// Example:
/// @code
///   auto claims = codec.validate(token);
///   if (!claims) {
///       reject(claims.error().code());
///       return;
///   }
///   use(claims.value().subject);
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace cas
