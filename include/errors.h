#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace orbion {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    CaptureUnavailable,   ///< No microphone device or permission
    OutputUnavailable,    ///< Output device could not be opened
    ConnectionFailed,     ///< Transport could not be opened
    SessionError,         ///< Remote endpoint reported a fatal error
    DecodeFailure,        ///< Malformed inbound audio chunk
    ParseError,
    InvalidState,
    IOError,
    Timeout
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::CaptureUnavailable: return "CaptureUnavailable";
        case ErrorType::OutputUnavailable: return "OutputUnavailable";
        case ErrorType::ConnectionFailed: return "ConnectionFailed";
        case ErrorType::SessionError: return "SessionError";
        case ErrorType::DecodeFailure: return "DecodeFailure";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::IOError: return "IOError";
        case ErrorType::Timeout: return "Timeout";
    }
    return "Unknown";
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    std::string to_string() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
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
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
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

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_capture_error(const std::string& message) {
    return Error(ErrorType::CaptureUnavailable, message);
}

inline Error make_connection_error(const std::string& message) {
    return Error(ErrorType::ConnectionFailed, message);
}

inline Error make_decode_error(const std::string& message) {
    return Error(ErrorType::DecodeFailure, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace orbion
