#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace sidr {

// Error codes for store parsing and report generation
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    IO_ERROR,
    INVALID_ARGUMENT,
    INTERNAL_ERROR,
    // ESE format errors
    OUT_OF_RANGE,          // Page number past the end of the file
    CORRUPT_PAGE,          // Page header, checksum or tag array inconsistent
    CATALOG_CORRUPT,       // MSysObjects entry unusable
    UNSUPPORTED_VERSION,   // Format version/revision outside supported range
    CORRUPT_BTREE,         // Tree structure inconsistent (bad flags, cycles)
    TRUNCATED_RECORD,      // Record offsets point past the record buffer
    SCHEMA_MISMATCH,       // Record references a column the schema lacks
    DANGLING_LONG_VALUE,   // Long value id without any segment
    // Embedded SQLite database
    SQLITE_ERROR
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

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
            case ErrorCode::CORRUPT_PAGE: return "CORRUPT_PAGE";
            case ErrorCode::CATALOG_CORRUPT: return "CATALOG_CORRUPT";
            case ErrorCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
            case ErrorCode::CORRUPT_BTREE: return "CORRUPT_BTREE";
            case ErrorCode::TRUNCATED_RECORD: return "TRUNCATED_RECORD";
            case ErrorCode::SCHEMA_MISMATCH: return "SCHEMA_MISMATCH";
            case ErrorCode::DANGLING_LONG_VALUE: return "DANGLING_LONG_VALUE";
            case ErrorCode::SQLITE_ERROR: return "SQLITE_ERROR";
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

    // Check if result is successful
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

    // Access value with default
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

    // Pointer-like access
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

// Helper for creating successful void results
inline Result<void> Ok() { return Result<void>(); }

// Helper for creating errors
inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

}  // namespace sidr
