#pragma once

/**
@file
@brief Macro for forcing function inlining.

This header defines `FORCE_INLINE`, which forces function inlining and marks the function `inline`.

In Debug builds, the macro only marks the function `inline` in order to not disrupt the debugging experience. Forced
inlining can also be disabled by defining `Tessera_DISABLE_FORCE_INLINE`.

Note that `FORCE_INLINE` always marks the function `inline` even when disabled.

The macro uses the appropriate attribute for MSVC, Clang and GCC. For any other compiler, it only marks the function
`inline`.
*/

/**
@def FORCE_INLINE
@brief Forces function inlining and marks the function `inline`.
*/

#if !defined(NDEBUG) || defined(Tessera_DISABLE_FORCE_INLINE)
    #define FORCE_INLINE inline
#elif defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    #define FORCE_INLINE [[gnu::always_inline]] inline
#elif defined(_MSC_VER)
    #define FORCE_INLINE [[msvc::forceinline]] inline
#else
    #define FORCE_INLINE inline
#endif
