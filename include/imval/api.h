// api.h - Symbol visibility macros for imval

#pragma once

/// @file api.h
/// @brief Export/import decoration for imval's non-template symbols.
///
/// - Shared build: CMake defines IMVAL_SHARED (public) and IMVAL_EXPORTS
///   (private to the library target). IMVAL_API then exports on the library
///   side and imports on the consumer side.
/// - Static build: nothing is defined and IMVAL_API is empty.
///
/// Template operations are instantiated explicitly in the library for both
/// memory policies; IMVAL_EXTERN_TEMPLATE / IMVAL_EXPORT_TEMPLATE mark the
/// matching declarations and definitions.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef IMVAL_SHARED
        #ifdef IMVAL_EXPORTS
            #define IMVAL_API __declspec(dllexport)
        #else
            #define IMVAL_API __declspec(dllimport)
        #endif
    #else
        #define IMVAL_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(IMVAL_SHARED) && defined(IMVAL_EXPORTS)
        #define IMVAL_API __attribute__((visibility("default")))
    #else
        #define IMVAL_API
    #endif
#else
    #define IMVAL_API
#endif

#define IMVAL_EXTERN_TEMPLATE extern template
#ifdef _MSC_VER
    #define IMVAL_EXPORT_TEMPLATE template IMVAL_API
#else
    #define IMVAL_EXPORT_TEMPLATE template
#endif
