/**
 * @file export.hpp
 * @brief Symbol visibility macros for lightscout_core shared library.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LIGHTSCOUT_CORE_BUILD)
        #define LIGHTSCOUT_CORE_API __declspec(dllexport)
    #else
        #define LIGHTSCOUT_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LIGHTSCOUT_CORE_BUILD)
        #define LIGHTSCOUT_CORE_API __attribute__((visibility("default")))
    #else
        #define LIGHTSCOUT_CORE_API
    #endif
#else
    #define LIGHTSCOUT_CORE_API
#endif
