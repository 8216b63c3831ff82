#pragma once

/// @file result.hpp
/// @brief Result<T,E> value-or-error type used across the resilience layer.

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace crr {

/// Minimal error payload for code that has no richer error type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a success value or an error, never both.
///
/// Expected failures (timeouts, rejected calls, missing configuration keys)
/// travel through Result instead of exceptions.
///
/// @code
///   auto resolved = loadSettings(config);
///   if (!resolved) {
///       CRR_LOG_ERROR(LogCategory::Config, std::string(resolved.error().message()));
///       return;
///   }
///   auto settings = std::move(resolved).value();
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Success value (undefined behavior when holding an error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Error value (undefined behavior when holding a value).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    /// Transform the success value, forwarding the error unchanged.
    template <typename F>
    [[nodiscard]] auto map(F&& fn) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (hasError()) {
            return Result<U, E>::err(error());
        }
        return Result<U, E>::ok(std::forward<F>(fn)(value()));
    }

private:
    template <std::size_t I, typename A>
    Result(std::in_place_index_t<I> tag, A&& arg) : data_(tag, std::forward<A>(arg)) {}

    // Index-based storage so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_{};
};

} // namespace crr
