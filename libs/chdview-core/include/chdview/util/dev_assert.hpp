#pragma once

/**
@file
@brief Development-time assertions.

Defines the following macros:
- `CHDVIEW_DEV_ASSERT(bool)`: checks for an internal invariant, breaking into the debugger if it fails.
- `CHDVIEW_DEV_CHECK()`: breaks into the debugger immediately.

These macros document invariants that the decoder upholds by construction. They never replace error handling: every
condition that can be triggered by malformed input is reported through `chdview::chd::Error`.

Development assertions must be enabled by defining the `chdview_DEV_ASSERTIONS` macro with a truthy value.
*/

#if defined(_MSC_VER)
    #define CHDVIEW_DEBUG_BREAK() __debugbreak()
#else
    #define CHDVIEW_DEBUG_BREAK() __builtin_trap()
#endif

/**
@def CHDVIEW_DEV_ASSERT
@brief Performs a development-time assertion, breaking into the debugger if the condition fails.
@param[in] condition the condition to check
*/

#if chdview_DEV_ASSERTIONS
    #define CHDVIEW_DEV_ASSERT(cond)   \
        do {                           \
            if (!(cond)) {             \
                CHDVIEW_DEBUG_BREAK(); \
            }                          \
        } while (false)

    #define CHDVIEW_DEV_CHECK()    \
        do {                       \
            CHDVIEW_DEBUG_BREAK(); \
        } while (false)
#else
    #define CHDVIEW_DEV_ASSERT(cond)
    #define CHDVIEW_DEV_CHECK()
#endif
