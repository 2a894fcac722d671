#pragma once

/** \file compiler.hpp
 *  \brief Branch hints for the classify hot path.
 */

#if defined(__GNUC__) || defined(__clang__)
    #define VERDICT_LIKELY(x) __builtin_expect(!!(x), 1)
    #define VERDICT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define VERDICT_LIKELY(x) (x)
    #define VERDICT_UNLIKELY(x) (x)
#endif
