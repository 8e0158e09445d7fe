// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macro for the treepath library.
///
/// - SHARED build: CMake defines TREEPATH_SHARED (public) and TREEPATH_EXPORTS
///   (private), so TREEPATH_API exports while building and imports when used.
/// - STATIC build: neither macro is defined and TREEPATH_API expands to nothing.
///
/// @code
/// class TREEPATH_API Diff { ... };
/// TREEPATH_API Path parse_path(std::string_view text);
/// @endcode

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef TREEPATH_SHARED
        #ifdef TREEPATH_EXPORTS
            #define TREEPATH_API __declspec(dllexport)
        #else
            #define TREEPATH_API __declspec(dllimport)
        #endif
    #else
        #define TREEPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(TREEPATH_SHARED) && defined(TREEPATH_EXPORTS)
        #define TREEPATH_API __attribute__((visibility("default")))
    #else
        #define TREEPATH_API
    #endif
#else
    #define TREEPATH_API
#endif
