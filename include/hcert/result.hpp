#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by every hcert decode stage
 *
 * Each pipeline stage returns a Result<T>. Stages up to and including the
 * CBOR decoder fail fast; the field mapper never fails and records
 * SchemaIssues instead.
 *
 * @example
 * ```cpp
 * auto bytes = hcert::base45_decode(body);
 * if (bytes.isErr()) {
 *     std::cerr << bytes.error().toString() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace hcert {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error kinds, one per pipeline stage plus the optional collaborators
 */
enum class ErrorCode {
    // Pipeline stages
    FORMAT_ERROR,       // bad scheme prefix
    DECODE_ERROR,       // base45 or CBOR malformation
    DECOMPRESS_ERROR,   // corrupt zlib stream
    ENVELOPE_ERROR,     // wrong COSE_Sign1 shape
    SCHEMA_ERROR,       // missing or mismatched field (recoverable)

    // Signature checks and configuration
    KEY_ERROR,
    CRYPTO_ERROR,
    CONFIG_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FORMAT_ERROR: return "FormatError";
        case ErrorCode::DECODE_ERROR: return "DecodeError";
        case ErrorCode::DECOMPRESS_ERROR: return "DecompressError";
        case ErrorCode::ENVELOPE_ERROR: return "EnvelopeError";
        case ErrorCode::SCHEMA_ERROR: return "SchemaError";
        case ErrorCode::KEY_ERROR: return "KeyError";
        case ErrorCode::CRYPTO_ERROR: return "CryptoError";
        case ErrorCode::CONFIG_ERROR: return "ConfigError";
        default: return "UnknownError";
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

// Shorthand used by the stage implementations
inline Error make_error(ErrorCode code, std::string message) {
    return Error(code, std::move(message));
}

} // namespace hcert
