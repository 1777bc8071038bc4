// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform export/import macros for the state_observer library.
///
/// - Building state_observer as a SHARED library:
///   CMake defines STATE_OBSERVER_EXPORTS (private) and STATE_OBSERVER_SHARED (public),
///   so everything marked STATE_OBSERVER_API is exported.
/// - Using it as a SHARED library: linking the target propagates STATE_OBSERVER_SHARED
///   and the same declarations become imports.
/// - STATIC builds: STATE_OBSERVER_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef STATE_OBSERVER_SHARED
        #ifdef STATE_OBSERVER_EXPORTS
            #define STATE_OBSERVER_API __declspec(dllexport)
        #else
            #define STATE_OBSERVER_API __declspec(dllimport)
        #endif
    #else
        #define STATE_OBSERVER_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STATE_OBSERVER_SHARED) && defined(STATE_OBSERVER_EXPORTS)
        #define STATE_OBSERVER_API __attribute__((visibility("default")))
    #else
        #define STATE_OBSERVER_API
    #endif
#else
    #define STATE_OBSERVER_API
#endif
