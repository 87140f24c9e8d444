/**
 * @file result.hpp
 * @brief Monadic error handling type for BufferedStatsd.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Submission,
 * flush and shutdown paths report failures as values; exceptions are reserved
 * for faults that the processing loop catches and converts into an Error.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace buffered_statsd {

/**
 * @brief Coarse classification of failures, used by callers to branch
 *        without parsing messages.
 */
enum class ErrorCode : uint8_t {
    Unknown,
    Closed,         ///< Buffer or transport no longer accepts work
    Transport,      ///< Send / close on the transport failed
    Timeout,        ///< Bounded wait expired
    Config,         ///< Invalid or unreadable configuration
    Fault,          ///< Processing loop terminated abnormally
    KindMismatch    ///< Two events with one key but different metric kinds
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:      return "unknown";
        case ErrorCode::Closed:       return "closed";
        case ErrorCode::Transport:    return "transport";
        case ErrorCode::Timeout:      return "timeout";
        case ErrorCode::Config:       return "config";
        case ErrorCode::Fault:        return "fault";
        case ErrorCode::KindMismatch: return "kind_mismatch";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations with no success payload
 *        (submit, send, close).
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Shorthand for the common "success, nothing to return" value.
inline Result<void> ok() { return Result<void>{}; }

/// Convenience factory for error results.
template <typename T = void>
Result<T> make_error(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Result<T>(Error{std::move(message), code});
}

}  // namespace buffered_statsd
