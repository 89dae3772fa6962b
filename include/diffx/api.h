// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macros for the diffx library.
///
/// CMake defines DIFFX_SHARED (public) and DIFFX_EXPORTS (private) when
/// diffx is built with DIFFX_BUILD_SHARED=ON. Static builds leave both
/// undefined and DIFFX_API expands to nothing.
///
/// @code
/// class DIFFX_API DiffCollector { ... };
/// DIFFX_API std::string format_output(...);
/// @endcode

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DIFFX_SHARED
        #ifdef DIFFX_EXPORTS
            #define DIFFX_API __declspec(dllexport)
        #else
            #define DIFFX_API __declspec(dllimport)
        #endif
    #else
        #define DIFFX_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DIFFX_SHARED) && defined(DIFFX_EXPORTS)
        #define DIFFX_API __attribute__((visibility("default")))
    #else
        #define DIFFX_API
    #endif
#else
    #define DIFFX_API
#endif
