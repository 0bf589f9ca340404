#pragma once

#include "velo/core/macros.hpp"
#include <atomic>
#include <cstdio>

// =============================================================================
// FILE: velo/core/log.hpp
// BRIEF: Leveled stderr diagnostics
// =============================================================================

namespace velo::log {

// 0: errors only, 1: + warnings (default), 2: + info, 3: + debug
enum class Level : int {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

namespace detail {
    inline std::atomic<int>& verbosity_slot() noexcept {
        static std::atomic<int> level{static_cast<int>(Level::Warning)};
        return level;
    }
}

inline void set_verbosity(int level) noexcept {
    if (level < 0) level = 0;
    if (level > 3) level = 3;
    detail::verbosity_slot().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline int verbosity() noexcept {
    return detail::verbosity_slot().load(std::memory_order_relaxed);
}

[[nodiscard]] VELO_FORCE_INLINE bool enabled(Level level) noexcept {
    return static_cast<int>(level) <= verbosity();
}

} // namespace velo::log

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define VELO_LOG_ERROR(...) \
    do { \
        std::fprintf(stderr, "ERROR: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while(0)

#define VELO_LOG_WARN(...) \
    do { \
        if (velo::log::enabled(velo::log::Level::Warning)) { \
            std::fprintf(stderr, "WARNING: "); \
            std::fprintf(stderr, __VA_ARGS__); \
            std::fprintf(stderr, "\n"); \
        } \
    } while(0)

#define VELO_LOG_INFO(...) \
    do { \
        if (velo::log::enabled(velo::log::Level::Info)) { \
            std::fprintf(stderr, "INFO: "); \
            std::fprintf(stderr, __VA_ARGS__); \
            std::fprintf(stderr, "\n"); \
        } \
    } while(0)

#define VELO_LOG_DEBUG(...) \
    do { \
        if (VELO_UNLIKELY(velo::log::enabled(velo::log::Level::Debug))) { \
            std::fprintf(stderr, "DEBUG: "); \
            std::fprintf(stderr, __VA_ARGS__); \
            std::fprintf(stderr, "\n"); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)
