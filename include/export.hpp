#pragma once

#if defined(_WIN32)
    #if defined(ARBOR_EXPORT)
        #define ARBOR_API __declspec(dllexport)
    #else
        #define ARBOR_API __declspec(dllimport)
    #endif
#else
    #define ARBOR_API __attribute__((visibility("default")))
#endif
