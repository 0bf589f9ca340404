#pragma once

#include <cstdint>
#include <cstddef>

// =============================================================================
// FILE: velo/config.hpp
// BRIEF: Compile-time configuration (backend, precision, index width)
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef VELO_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define VELO_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define VELO_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define VELO_OS_LINUX
#else
    #define VELO_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

#if !defined(VELO_BACKEND_SERIAL) && !defined(VELO_BACKEND_TBB) && \
    !defined(VELO_BACKEND_OPENMP) && !defined(VELO_BACKEND_BS)
    #if defined(VELO_OS_MAC)
        // macOS ships without libomp; VELO_MAC_USE_OPENMP opts back in
        #if defined(VELO_MAC_USE_OPENMP)
            #define VELO_BACKEND_OPENMP
        #else
            #define VELO_BACKEND_BS
        #endif
    #elif defined(VELO_OS_WINDOWS) || defined(VELO_OS_LINUX)
        #define VELO_BACKEND_OPENMP
    #else
        #define VELO_BACKEND_BS
    #endif
#endif

#if (defined(VELO_BACKEND_SERIAL) && (defined(VELO_BACKEND_TBB) || defined(VELO_BACKEND_OPENMP) || defined(VELO_BACKEND_BS))) || \
    (defined(VELO_BACKEND_TBB) && (defined(VELO_BACKEND_OPENMP) || defined(VELO_BACKEND_BS))) || \
    (defined(VELO_BACKEND_OPENMP) && defined(VELO_BACKEND_BS))
    #error "VELO Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(VELO_BACKEND_OPENMP)
    #define VELO_USE_OPENMP 1
#elif defined(VELO_BACKEND_TBB)
    #define VELO_USE_TBB 1
#elif defined(VELO_BACKEND_BS)
    #define VELO_USE_BS 1
#elif defined(VELO_BACKEND_SERIAL)
    #define VELO_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default)
#ifndef VELO_PRECISION
    #define VELO_PRECISION 1
#endif

#if VELO_PRECISION == 0
    #define VELO_USE_FLOAT32
#elif VELO_PRECISION == 1
    #define VELO_USE_FLOAT64
#else
    #error "VELO Configuration Error: Invalid VELO_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 0: int16, 1: int32, 2: int64 (default)
#ifndef VELO_INDEX_PRECISION
    #define VELO_INDEX_PRECISION 2
#endif

#if VELO_INDEX_PRECISION == 0
    #define VELO_USE_INT16
#elif VELO_INDEX_PRECISION == 1
    #define VELO_USE_INT32
#elif VELO_INDEX_PRECISION == 2
    #define VELO_USE_INT64
#else
    #error "VELO Configuration Error: Invalid VELO_INDEX_PRECISION value. " \
           "Must be 0 (int16), 1 (int32), or 2 (int64)."
#endif

// =============================================================================
// Version
// =============================================================================

#define VELO_VERSION_MAJOR 0
#define VELO_VERSION_MINOR 3
#define VELO_VERSION_PATCH 0
#define VELO_VERSION_STRING "0.3.0"
