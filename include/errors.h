#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace voxlink {

/**
 * @brief Failure categories across the voice link
 *
 * NetworkError covers transport failures (resolve, TLS, socket drop);
 * RemoteError is a well-formed error reply from a peer service.
 */
enum class ErrorType {
    None,
    IOError,
    NetworkError,
    RemoteError,
    ParseError,
    AuthError,
    DeviceError,
    ConfigError,
    InvalidState,
    Timeout
};

/**
 * @brief Error category plus a human-readable message
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
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

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_remote_error(const std::string& message) {
    return Error(ErrorType::RemoteError, message);
}

inline Error make_auth_error(const std::string& message) {
    return Error(ErrorType::AuthError, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceError, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::ConfigError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::IOError: return "io";
        case ErrorType::NetworkError: return "network";
        case ErrorType::RemoteError: return "remote";
        case ErrorType::ParseError: return "parse";
        case ErrorType::AuthError: return "auth";
        case ErrorType::DeviceError: return "device";
        case ErrorType::ConfigError: return "config";
        case ErrorType::InvalidState: return "invalid_state";
        case ErrorType::Timeout: return "timeout";
        default: return "unknown";
    }
}

/// "<category>: <message>" for log lines
inline std::string describe(const Error& error) {
    return std::string(error_type_name(error.type)) + ": " + error.message;
}

} // namespace voxlink
