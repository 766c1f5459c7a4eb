#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace langlint {

// Error codes shared by extraction, reconstruction and translation
enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,
    NOT_FOUND,
    IO_ERROR,
    PARSE_ERROR,            // Malformed input document (e.g. notebook JSON)
    RECONSTRUCTION_FAILED,
    UNSUPPORTED_FORMAT,     // No parser accepts the file
    // Translation error codes
    UNSUPPORTED_LANGUAGE,
    INVALID_INPUT,          // Empty or whitespace-only text
    TRANSLATION_FAILED,     // Backend, HTTP or response-shape failure
    NETWORK_ERROR,          // Transport-level failure
    TIMEOUT,
    RATE_LIMITED,           // Reserved, not raised by the current backends
    INTERNAL_ERROR
};

// Error with code, message and optional provenance.
// origin names the component that produced the error (e.g. a translator),
// detail carries a machine-readable code such as an HTTP status.
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "",
          std::string origin = "", std::string detail = "")
        : code_(code),
          message_(std::move(message)),
          origin_(std::move(origin)),
          detail_(std::move(detail)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& origin() const { return origin_; }
    const std::string& detail() const { return detail_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        std::string out = error_code_name(code_);
        if (message_.empty() && origin_.empty()) {
            return out;
        }
        out += ":";
        if (!origin_.empty()) {
            out += " [" + origin_ + "]";
        }
        if (!message_.empty()) {
            out += " " + message_;
        }
        if (!detail_.empty()) {
            out += " (" + detail_ + ")";
        }
        return out;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::PARSE_ERROR: return "PARSE_ERROR";
            case ErrorCode::RECONSTRUCTION_FAILED: return "RECONSTRUCTION_FAILED";
            case ErrorCode::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
            case ErrorCode::UNSUPPORTED_LANGUAGE: return "UNSUPPORTED_LANGUAGE";
            case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
            case ErrorCode::TRANSLATION_FAILED: return "TRANSLATION_FAILED";
            case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
            case ErrorCode::TIMEOUT: return "TIMEOUT";
            case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string origin_;
    std::string detail_;
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

}  // namespace langlint
