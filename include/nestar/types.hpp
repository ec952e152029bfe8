#pragma once

/**
 * @file types.hpp
 * @brief Shared value types and the Result/Error pair used by every fallible
 *        nestar operation.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nestar {

/// Raw resource payload
using Bytes = std::vector<uint8_t>;

// ============================================================================
// Layout Kind
// ============================================================================

/**
 * @brief How inner archives are laid out inside the outer container
 *
 * Flat:   inner archives are stored whole as entries and are parsed eagerly.
 * Inline: inner archive entries are copied under "<archive>/" prefixes and
 *         located through the META-INF/INDEX.LIST document.
 */
enum class LayoutKind {
    Flat,
    Inline
};

inline const char* layout_to_string(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Flat: return "flat";
        case LayoutKind::Inline: return "inline";
        default: return "flat";
    }
}

/// Parse a layout name (case-insensitive); nullopt if unrecognized
std::optional<LayoutKind> parse_layout_kind(const std::string& s);

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for nestar operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    IO_ERROR,

    // Archive structure
    CORRUPT_ARCHIVE,
    UNSUPPORTED_COMPRESSION,

    // Container metadata
    INDEX_MISSING,
    UNSUPPORTED_VERSION,

    // Resolution
    NOT_A_FILE,
    MATERIALIZE_FAILED,

    // Configuration
    CONFIG_PARSE_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CORRUPT_ARCHIVE: return "CORRUPT_ARCHIVE";
        case ErrorCode::UNSUPPORTED_COMPRESSION: return "UNSUPPORTED_COMPRESSION";
        case ErrorCode::INDEX_MISSING: return "INDEX_MISSING";
        case ErrorCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case ErrorCode::NOT_A_FILE: return "NOT_A_FILE";
        case ErrorCode::MATERIALIZE_FAILED: return "MATERIALIZE_FAILED";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
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

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 * Move-only value types are supported; use takeValue() to move them out.
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
    T takeValue() { return std::move(value_.value()); }
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

// ============================================================================
// Logical Paths
// ============================================================================

/// Strip a leading '/' and convert '\\' to '/'
std::string normalize_logical_path(const std::string& path);

/// Namespace prefix of a logical path: everything up to and including the
/// last '/', or "" for a top-level path
std::string namespace_prefix(const std::string& path);

/// Namespace key for the registrar: leading and trailing '/' removed
std::string namespace_key(const std::string& name);

/// True if `name` ends with one of `suffixes` (case-insensitive)
bool has_suffix(const std::string& name, const std::vector<std::string>& suffixes);

} // namespace nestar
