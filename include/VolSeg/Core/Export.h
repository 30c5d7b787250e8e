#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - VOLSEG_BUILD_SHARED: when building VolSeg as shared library
 *   - VOLSEG_USE_SHARED: when using VolSeg as shared library
 *   - neither: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(VOLSEG_BUILD_SHARED)
        #define VOLSEG_API __declspec(dllexport)
    #elif defined(VOLSEG_USE_SHARED)
        #define VOLSEG_API __declspec(dllimport)
    #else
        #define VOLSEG_API
    #endif
#else
    #if defined(VOLSEG_BUILD_SHARED)
        #define VOLSEG_API __attribute__((visibility("default")))
    #else
        #define VOLSEG_API
    #endif
#endif
