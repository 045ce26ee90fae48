#pragma once

/**
 * @file result.hpp
 * @brief Error codes and the Result type returned by fallible postbuild operations
 *
 * @example
 * ```cpp
 * auto specs = postbuild::parse_file_specs(doc);
 * if (specs.isErr()) {
 *     std::cerr << specs.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace postbuild {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for postbuild operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    IO_ERROR,

    // Build spec and files DSL
    INVALID_SPEC,
    MISSING_VARIABLE,
    UNSUPPORTED,
    TARGET_EXISTS,

    // Shebang relocation
    UNSUPPORTED_INTERPRETER,
    MISSING_LAUNCHER,

    // Store, profile and whitelist
    ARTIFACT_NOT_FOUND,
    MISSING_FILE,
    PATH_TRAVERSAL,
    HASH_MISMATCH,

    // Configuration
    CONFIG_INVALID,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INVALID_SPEC: return "INVALID_SPEC";
        case ErrorCode::MISSING_VARIABLE: return "MISSING_VARIABLE";
        case ErrorCode::UNSUPPORTED: return "UNSUPPORTED";
        case ErrorCode::TARGET_EXISTS: return "TARGET_EXISTS";
        case ErrorCode::UNSUPPORTED_INTERPRETER: return "UNSUPPORTED_INTERPRETER";
        case ErrorCode::MISSING_LAUNCHER: return "MISSING_LAUNCHER";
        case ErrorCode::ARTIFACT_NOT_FOUND: return "ARTIFACT_NOT_FOUND";
        case ErrorCode::MISSING_FILE: return "MISSING_FILE";
        case ErrorCode::PATH_TRAVERSAL: return "PATH_TRAVERSAL";
        case ErrorCode::HASH_MISMATCH: return "HASH_MISMATCH";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

using VoidResult = Result<void>;

} // namespace postbuild
