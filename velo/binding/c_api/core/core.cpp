// =============================================================================
// FILE: velo/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "velo/config.hpp"
#include "velo/binding/c_api/core/core.h"
#include "velo/binding/c_api/core/internal.hpp"
#include "velo/core/error.hpp"
#include "velo/core/log.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace velo::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local velo_error_t g_last_error_code = VELO_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(velo_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (VELO_LIKELY(message != nullptr)) {
        std::strncpy(g_last_error_message.data(), message,
                     ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(velo_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = VELO_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (VELO_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> velo_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

namespace {

auto report(velo_error_t code, const char* message) noexcept -> velo_error_t {
    set_last_error(code, message);
    return code;
}

} // anonymous namespace

// Most specific types first; every velo exception carries its own code
[[nodiscard]] auto handle_exception() noexcept -> velo_error_t {
    try {
        throw;
    }
    catch (const Exception& e) {
        return report(static_cast<velo_error_t>(e.code()), e.what());
    }
    catch (const std::bad_alloc&) {
        return report(VELO_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
    }
    catch (const std::length_error& e) {
        return report(VELO_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::out_of_range& e) {
        return report(VELO_ERROR_RANGE_ERROR, e.what());
    }
    catch (const std::domain_error& e) {
        return report(VELO_ERROR_DOMAIN_ERROR, e.what());
    }
    catch (const std::logic_error& e) {
        return report(VELO_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::exception& e) {
        return report(VELO_ERROR_UNKNOWN, e.what());
    }
    catch (...) {
        return report(VELO_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
    }
}

} // namespace velo::binding

// =============================================================================
// C API Implementation
// =============================================================================

extern "C" {

VELO_C_EXPORT const char* velo_get_version(void) {
    return VELO_VERSION_STRING;
}

VELO_C_EXPORT const char* velo_get_build_config(void) {
    static const char* config_str =
        VELO_REAL_TYPE_NAME "+" VELO_INDEX_TYPE_NAME
#if defined(__AVX512F__)
        "+avx512"
#elif defined(__AVX2__)
        "+avx2"
#elif defined(__AVX__)
        "+avx"
#elif defined(__SSE4_2__)
        "+sse4.2"
#elif defined(__SSE2__)
        "+sse2"
#else
        "+scalar"
#endif
#if defined(_OPENMP)
        "+openmp"
#endif
#if defined(VELO_HAS_HDF5)
        "+hdf5"
#endif
        ;
    return config_str;
}

VELO_C_EXPORT const char* velo_get_last_error(void) {
    return velo::binding::get_last_error_message();
}

VELO_C_EXPORT velo_error_t velo_get_last_error_code(void) {
    return velo::binding::get_last_error_code();
}

VELO_C_EXPORT void velo_clear_error(void) {
    velo::binding::clear_last_error();
}

VELO_C_EXPORT velo_bool_t velo_is_ok(velo_error_t code) {
    return (code == VELO_OK) ? VELO_TRUE : VELO_FALSE;
}

VELO_C_EXPORT velo_bool_t velo_is_error(velo_error_t code) {
    return (code != VELO_OK) ? VELO_TRUE : VELO_FALSE;
}

VELO_C_EXPORT void velo_set_verbosity(int32_t level) {
    velo::log::set_verbosity(static_cast<int>(level));
}

} // extern "C"
