/**
 * @file result.hpp
 * @brief Monadic error handling type for HybridOrchestrator.
 *
 * Result<T, E> is the only error-propagation mechanism on orchestration
 * paths: admission, scheduling, dispatch and recovery never throw.
 * Domain modules define their own E (ValidationError, SelectionError,
 * DispatchError, ...); the generic Error below covers configuration and
 * storage failures.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace hybrid_orchestrator {

/**
 * @brief Generic error carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 *
 * Accessing the wrong alternative throws std::logic_error; that is a
 * programming defect, not an error path.
 */
template <typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::logic_error("Result has no value");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result has no value");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result has no value");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::logic_error("Result has no error");
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result has no error");
        return std::get<1>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result with the same error type.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Convert the error into another error type.
    template <typename F>
    auto map_error(F&& func) const -> Result<T, std::invoke_result_t<F, const E&>> {
        if (has_value()) {
            return value();
        }
        return func(error());
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for operations without a success value.
 */
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::logic_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Convenience factory for generic error results.
template <typename T>
Result<T, Error> make_error(std::string message) {
    return Result<T, Error>(Error{std::move(message)});
}

}  // namespace hybrid_orchestrator
