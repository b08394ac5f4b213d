#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace parley {

/**
 * @brief Failure categories shared by providers, tools, memory and the coordinator
 */
enum class ErrorType {
    None,
    TransientProvider,      ///< Timeout, rate limit, connection drop; worth retrying
    UnsupportedCapability,  ///< Provider rejected tool-augmented requests
    Provider,               ///< Any other provider failure (bad request, malformed reply)
    ToolExecution,          ///< Tool handler failed or threw
    Validation,             ///< Arguments rejected by a tool's parameter schema
    IndexUnavailable,       ///< Vector index missing or corrupted
    LoopBoundExceeded,      ///< Too many tool rounds in one turn
    Cancelled,
    Busy,                   ///< Session cannot accept another message right now
    Timeout,
    IOError,
    ParseError,
    InvalidState
};

const char* error_type_name(ErrorType type);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;
    bool retryable = false;

    Error() = default;
    Error(ErrorType t, const std::string& msg, bool can_retry = false)
        : type(t), message(msg), retryable(can_retry) {}

    bool is_error() const { return type != ErrorType::None; }
    explicit operator bool() const { return is_error(); }

    /// "<TypeName>: <message>"
    std::string describe() const;
};

/**
 * @brief Holds either a value of type T or an Error
 *
 * Similar to Rust's Result<T, E> or C++23's std::expected.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::logic_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::logic_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::logic_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_transient_error(const std::string& message) {
    return Error(ErrorType::TransientProvider, message, true);
}

inline Error make_unsupported_error(const std::string& message) {
    return Error(ErrorType::UnsupportedCapability, message);
}

inline Error make_provider_error(const std::string& message) {
    return Error(ErrorType::Provider, message);
}

inline Error make_validation_error(const std::string& message) {
    return Error(ErrorType::Validation, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message, true);
}

inline Error make_cancelled_error(const std::string& message = "Cancelled") {
    return Error(ErrorType::Cancelled, message);
}

} // namespace parley
