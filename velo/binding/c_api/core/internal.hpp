#pragma once

// =============================================================================
// FILE: velo/binding/c_api/core/internal.hpp
// BRIEF: Internal helpers for the C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
// =============================================================================

#include "velo/binding/c_api/core/core.h"
#include "velo/core/error.hpp"
#include "velo/core/type.hpp"

#include <string_view>
#include <type_traits>

namespace velo::binding {

static_assert(std::is_same_v<velo_real_t, Real>, "velo_real_t must match velo::Real");
static_assert(std::is_same_v<velo_index_t, Index>, "velo_index_t must match velo::Index");

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(velo_error_t code, const char* message) noexcept;

void set_last_error(velo_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> velo_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert active C++ exception to C error code
// Must be called from within a catch block
[[nodiscard]] auto handle_exception() noexcept -> velo_error_t;

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define VELO_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (VELO_UNLIKELY((ptr) == nullptr)) { \
            velo::binding::set_last_error(VELO_ERROR_NULL_POINTER, (msg)); \
            return VELO_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define VELO_C_API_CHECK(cond, code, msg) \
    do { \
        if (VELO_UNLIKELY(!(cond))) { \
            velo::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define VELO_C_API_TRY try {

#define VELO_C_API_CATCH \
    } catch (...) { \
        return velo::binding::handle_exception(); \
    }

#define VELO_C_API_RETURN_OK \
    do { \
        velo::binding::clear_last_error(); \
        return VELO_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace velo::binding
