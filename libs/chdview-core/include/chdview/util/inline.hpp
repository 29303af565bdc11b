#pragma once

/**
@file
@brief Macros for managing function inlining.

This header defines the following macros:
- `FORCE_INLINE`: Forces function inlining and marks the function `inline`
- `NO_INLINE`: Prevents function inlining

In Debug builds, these macros have no effect in order to not disrupt the debugging experience. The inline macros can be
disabled by defining `chdview_DISABLE_FORCE_INLINE`.

Note that `FORCE_INLINE` always marks the function `inline` even when disabled.

The macros use appropriate attributes for MSVC, Clang and GCC. For any other compiler, these macros do nothing.
*/

#if !defined(NDEBUG) || defined(chdview_DISABLE_FORCE_INLINE)
    #define FORCE_INLINE inline
    #define NO_INLINE
#elif defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    #define FORCE_INLINE [[gnu::always_inline]] inline
    #define NO_INLINE [[gnu::noinline]]
#elif defined(_MSC_VER)
    #define FORCE_INLINE [[msvc::forceinline]] inline
    #define NO_INLINE [[msvc::noinline]]
#else
    #define FORCE_INLINE inline
    #define NO_INLINE
#endif
