#pragma once

#include "velo/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(VELO_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: velo/core/simd.hpp
// BRIEF: SIMD wrapper (Google Highway, static dispatch)
// =============================================================================

namespace velo::simd {

    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<velo::Real>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag, ScalableTag<T>>;

} // namespace velo::simd
