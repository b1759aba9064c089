#pragma once

// Macro definitions for controlling DLL import/export
#ifdef _WIN32
    #ifdef LABELLINK_STATIC
        // Static library
        #define LABELLINK_API
    #elif defined(LABELLINK_EXPORTS)
        // Dynamic library export
        #define LABELLINK_API __declspec(dllexport)
    #else
        // Dynamic library import
        #define LABELLINK_API __declspec(dllimport)
    #endif
#else
    // Non-Windows platform
    #if defined(LABELLINK_EXPORTS) && defined(__GNUC__) && __GNUC__ >= 4
        #define LABELLINK_API __attribute__ ((visibility ("default")))
    #else
        #define LABELLINK_API
    #endif
#endif
