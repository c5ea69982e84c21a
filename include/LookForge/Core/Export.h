#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - LOOKFORGE_BUILD_SHARED: when building LookForge as shared library
 *   - LOOKFORGE_USE_SHARED: when using LookForge as shared library
 *   - LOOKFORGE_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LOOKFORGE_BUILD_SHARED)
        #define LOOKFORGE_API __declspec(dllexport)
    #elif defined(LOOKFORGE_USE_SHARED)
        #define LOOKFORGE_API __declspec(dllimport)
    #else
        #define LOOKFORGE_API
    #endif
#else
    #if defined(LOOKFORGE_BUILD_SHARED)
        #define LOOKFORGE_API __attribute__((visibility("default")))
    #else
        #define LOOKFORGE_API
    #endif
#endif
