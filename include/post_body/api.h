// api.h - DLL export/import macros for post_body

#pragma once

/// @file api.h
/// @brief POST_BODY_API marks the symbols of the post_body library.
///
/// The post_body CMake target defines POST_BODY_SHARED (public) and
/// POST_BODY_EXPORTS (private) when POST_BODY_BUILD_SHARED is ON. The default
/// static build defines neither and the macro expands to nothing.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef POST_BODY_SHARED
        #ifdef POST_BODY_EXPORTS
            #define POST_BODY_API __declspec(dllexport)
        #else
            #define POST_BODY_API __declspec(dllimport)
        #endif
    #else
        #define POST_BODY_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(POST_BODY_SHARED) && defined(POST_BODY_EXPORTS)
        #define POST_BODY_API __attribute__((visibility("default")))
    #else
        #define POST_BODY_API
    #endif
#else
    #define POST_BODY_API
#endif
