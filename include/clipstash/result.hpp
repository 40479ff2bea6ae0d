#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace clipstash {

// Error codes for the clipboard store, grouped in bands
enum class ErrorCode {
    OK = 0,

    // Generic
    UNKNOWN_ERROR,
    VALIDATION_ERROR,
    NOT_FOUND,
    ALREADY_EXISTS,
    INVALID_OPERATION,
    CANCELED,

    // Domain invariants
    DOMAIN_LIMIT_EXCEEDED = 1000,
    CLIPBOARD_ITEM_INVALID,
    CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
    CLIPBOARD_IMAGE_TOO_LARGE,
    CLIPBOARD_HISTORY_ITEM_NOT_FOUND,
    PINNED_ITEM_DUPLICATE,
    PINNED_ITEM_NOT_FOUND,
    PINNED_ITEMS_LIMIT_EXCEEDED,
    SETTINGS_INVALID,
    SETTINGS_RANGE_INVALID,
    SETTINGS_SHORTCUT_INVALID,

    // Application workflow
    STATE_INITIALIZATION_FAILED = 2000,
    STATE_PERSISTENCE_FAILED,
    CLIPBOARD_MONITOR_START_FAILED,
    RUNTIME_START_FAILED,
    RUNTIME_STOP_FAILED,

    // Infrastructure: storage, serialization, encryption
    STORAGE_PATH_UNAVAILABLE = 3000,
    STORAGE_DIRECTORY_CREATE_FAILED,
    STORAGE_READ_FAILED,
    STORAGE_WRITE_FAILED,
    STORAGE_DELETE_FAILED,
    STORAGE_ACCESS_DENIED,
    SERIALIZATION_FAILED,
    DESERIALIZATION_FAILED,
    DATA_FORMAT_INVALID,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    ENCRYPTED_PAYLOAD_INVALID,
    ENCRYPTION_KEY_UNAVAILABLE
};

enum class ErrorBand {
    GENERIC,
    DOMAIN,
    APPLICATION,
    INFRASTRUCTURE
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    ErrorBand band() const {
        int value = static_cast<int>(code_);
        if (value >= 3000) return ErrorBand::INFRASTRUCTURE;
        if (value >= 2000) return ErrorBand::APPLICATION;
        if (value >= 1000) return ErrorBand::DOMAIN;
        return ErrorBand::GENERIC;
    }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
            case ErrorCode::INVALID_OPERATION: return "INVALID_OPERATION";
            case ErrorCode::CANCELED: return "CANCELED";
            case ErrorCode::DOMAIN_LIMIT_EXCEEDED: return "DOMAIN_LIMIT_EXCEEDED";
            case ErrorCode::CLIPBOARD_ITEM_INVALID: return "CLIPBOARD_ITEM_INVALID";
            case ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE: return "CLIPBOARD_ITEM_UNSUPPORTED_TYPE";
            case ErrorCode::CLIPBOARD_IMAGE_TOO_LARGE: return "CLIPBOARD_IMAGE_TOO_LARGE";
            case ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND: return "CLIPBOARD_HISTORY_ITEM_NOT_FOUND";
            case ErrorCode::PINNED_ITEM_DUPLICATE: return "PINNED_ITEM_DUPLICATE";
            case ErrorCode::PINNED_ITEM_NOT_FOUND: return "PINNED_ITEM_NOT_FOUND";
            case ErrorCode::PINNED_ITEMS_LIMIT_EXCEEDED: return "PINNED_ITEMS_LIMIT_EXCEEDED";
            case ErrorCode::SETTINGS_INVALID: return "SETTINGS_INVALID";
            case ErrorCode::SETTINGS_RANGE_INVALID: return "SETTINGS_RANGE_INVALID";
            case ErrorCode::SETTINGS_SHORTCUT_INVALID: return "SETTINGS_SHORTCUT_INVALID";
            case ErrorCode::STATE_INITIALIZATION_FAILED: return "STATE_INITIALIZATION_FAILED";
            case ErrorCode::STATE_PERSISTENCE_FAILED: return "STATE_PERSISTENCE_FAILED";
            case ErrorCode::CLIPBOARD_MONITOR_START_FAILED: return "CLIPBOARD_MONITOR_START_FAILED";
            case ErrorCode::RUNTIME_START_FAILED: return "RUNTIME_START_FAILED";
            case ErrorCode::RUNTIME_STOP_FAILED: return "RUNTIME_STOP_FAILED";
            case ErrorCode::STORAGE_PATH_UNAVAILABLE: return "STORAGE_PATH_UNAVAILABLE";
            case ErrorCode::STORAGE_DIRECTORY_CREATE_FAILED: return "STORAGE_DIRECTORY_CREATE_FAILED";
            case ErrorCode::STORAGE_READ_FAILED: return "STORAGE_READ_FAILED";
            case ErrorCode::STORAGE_WRITE_FAILED: return "STORAGE_WRITE_FAILED";
            case ErrorCode::STORAGE_DELETE_FAILED: return "STORAGE_DELETE_FAILED";
            case ErrorCode::STORAGE_ACCESS_DENIED: return "STORAGE_ACCESS_DENIED";
            case ErrorCode::SERIALIZATION_FAILED: return "SERIALIZATION_FAILED";
            case ErrorCode::DESERIALIZATION_FAILED: return "DESERIALIZATION_FAILED";
            case ErrorCode::DATA_FORMAT_INVALID: return "DATA_FORMAT_INVALID";
            case ErrorCode::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
            case ErrorCode::DECRYPTION_FAILED: return "DECRYPTION_FAILED";
            case ErrorCode::ENCRYPTED_PAYLOAD_INVALID: return "ENCRYPTED_PAYLOAD_INVALID";
            case ErrorCode::ENCRYPTION_KEY_UNAVAILABLE: return "ENCRYPTION_KEY_UNAVAILABLE";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
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

// Re-wrap a lower-level failure under a workflow code, keeping its detail
inline Error wrap_error(ErrorCode code, const std::string& context, const Error& cause) {
    return Error(code, context + " (" + cause.to_string() + ")");
}

}  // namespace clipstash
