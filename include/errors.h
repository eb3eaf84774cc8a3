#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace duplex_voice {

/**
 * @brief Error types for different failure modes
 *
 * Capture side: PermissionDenied, DeviceUnavailable.
 * Transport side: NetworkError, AuthError, ProtocolError.
 * DecodeError is recovered locally (chunk dropped), never fatal to a session.
 */
enum class ErrorType {
    None,
    PermissionDenied,
    DeviceUnavailable,
    NetworkError,
    AuthError,
    ProtocolError,
    DecodeError,
    InvalidState,
    ConfigError,
    Unknown
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::PermissionDenied: return "PermissionDenied";
        case ErrorType::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::AuthError: return "AuthError";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::DecodeError: return "DecodeError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::Unknown: return "Unknown";
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

    std::string describe() const {
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

/**
 * @brief Thrown by SessionController::connect() while a session is already
 * Connecting or Connected. A caller bug, not a runtime failure.
 */
class SessionActiveError : public std::logic_error {
public:
    explicit SessionActiveError(const std::string& message) : std::logic_error(message) {}
};

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_permission_error(const std::string& message) {
    return Error(ErrorType::PermissionDenied, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceUnavailable, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_auth_error(const std::string& message) {
    return Error(ErrorType::AuthError, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolError, message);
}

inline Error make_decode_error(const std::string& message) {
    return Error(ErrorType::DecodeError, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::ConfigError, message);
}

} // namespace duplex_voice
