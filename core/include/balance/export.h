#pragma once

#ifdef _WIN32
    #ifdef BALANCE_EXPORTS
        #define BL_API __declspec(dllexport)
    #else
        #define BL_API __declspec(dllimport)
    #endif
#else
    #define BL_API __attribute__((visibility("default")))
#endif
