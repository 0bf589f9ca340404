#pragma once

// =============================================================================
// FILE: velo/binding/c_api/core/core.h
// BRIEF: C ABI for the velo dynamics library
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for Python FFI and cross-language bindings
//   - Opaque handles for stateful objects
//   - Thread-safe error reporting via thread-local storage
//   - Compatible with C99 and C++11+
//
// ABI STABILITY GUARANTEE:
//   - Error codes are stable across versions
//   - Handle types remain opaque
//   - Function signatures will not change within major version
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define VELO_C_API_VERSION_MAJOR 1
#define VELO_C_API_VERSION_MINOR 0
#define VELO_C_API_VERSION_PATCH 0

// =============================================================================
// Export Macro
// =============================================================================

#if defined(_MSC_VER)
    #define VELO_C_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define VELO_C_EXPORT __attribute__((visibility("default")))
#else
    #define VELO_C_EXPORT
#endif

// Get runtime library version string (e.g., "0.3.0")
const char* velo_get_version(void);

// Get build configuration (e.g., "float64+int64+avx2+openmp+hdf5")
const char* velo_get_build_config(void);

// =============================================================================
// Basic Value Types (Must Match C++ velo::Real and velo::Index)
// =============================================================================

#if defined(VELO_USE_FLOAT32) || (defined(VELO_PRECISION) && VELO_PRECISION == 0)
typedef float velo_real_t;
#define VELO_REAL_TYPE_NAME "float32"
#else
typedef double velo_real_t;
#define VELO_REAL_TYPE_NAME "float64"
#endif

#if defined(VELO_USE_INT16) || (defined(VELO_INDEX_PRECISION) && VELO_INDEX_PRECISION == 0)
typedef int16_t velo_index_t;
#define VELO_INDEX_TYPE_NAME "int16"
#elif defined(VELO_USE_INT32) || (defined(VELO_INDEX_PRECISION) && VELO_INDEX_PRECISION == 1)
typedef int32_t velo_index_t;
#define VELO_INDEX_TYPE_NAME "int32"
#else
typedef int64_t velo_index_t;
#define VELO_INDEX_TYPE_NAME "int64"
#endif

typedef size_t velo_size_t;

typedef int velo_bool_t;
#define VELO_TRUE 1
#define VELO_FALSE 0

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, matches velo::ErrorCode)
typedef int32_t velo_error_t;

#define VELO_OK 0

// General errors (1-9)
#define VELO_ERROR_UNKNOWN 1
#define VELO_ERROR_INTERNAL 2
#define VELO_ERROR_OUT_OF_MEMORY 3
#define VELO_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define VELO_ERROR_INVALID_ARGUMENT 10
#define VELO_ERROR_DIMENSION_MISMATCH 11
#define VELO_ERROR_DOMAIN_ERROR 12
#define VELO_ERROR_RANGE_ERROR 13
#define VELO_ERROR_INDEX_OUT_OF_BOUNDS 14

// I/O errors (30-39)
#define VELO_ERROR_IO_ERROR 30
#define VELO_ERROR_FILE_NOT_FOUND 31
#define VELO_ERROR_READ_ERROR 33

// Feature errors (40-49)
#define VELO_ERROR_FEATURE_UNAVAILABLE 41

// Get human-readable error message for last error (thread-local)
// Returns "No error" if no error has occurred
const char* velo_get_last_error(void);

// Get last error code (thread-local)
velo_error_t velo_get_last_error_code(void);

// Clear last error (thread-local)
void velo_clear_error(void);

velo_bool_t velo_is_ok(velo_error_t code);

velo_bool_t velo_is_error(velo_error_t code);

// Set library log verbosity (0 = errors, 1 = warnings, 2 = info, 3 = debug)
void velo_set_verbosity(int32_t level);

#ifdef __cplusplus
}
#endif
