#pragma once

#include "velo/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: velo/core/error.hpp
// BRIEF: Exception hierarchy and validation macros
// =============================================================================

namespace velo {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    RANGE_ERROR = 13,
    INDEX_OUT_OF_BOUNDS = 14,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,

    // Feature errors
    FEATURE_UNAVAILABLE = 41,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class VELO_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal VELO Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg)
        : IOError(ErrorCode::READ_ERROR, msg) {}
};

class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(const std::string& msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

// Internal invariants (active in all builds)
#define VELO_ASSERT(condition, msg) \
    do { \
        if (VELO_UNLIKELY(!(condition))) { \
            throw velo::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// User input validation
#define VELO_CHECK_ARG(condition, msg) \
    do { \
        if (VELO_UNLIKELY(!(condition))) { \
            throw velo::ValueError(msg); \
        } \
    } while(0)

#define VELO_CHECK_DIM(condition, msg) \
    do { \
        if (VELO_UNLIKELY(!(condition))) { \
            throw velo::DimensionError(msg); \
        } \
    } while(0)

#define VELO_CHECK_NULL(ptr, msg) \
    do { \
        if (VELO_UNLIKELY((ptr) == nullptr)) { \
            throw velo::NullPointerError(msg); \
        } \
    } while(0)

#define VELO_CHECK_RANGE(value, min_val, max_val, msg) \
    do { \
        if (VELO_UNLIKELY((value) < (min_val) || (value) > (max_val))) { \
            throw velo::RangeError(msg); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace velo
