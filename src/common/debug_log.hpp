#pragma once

#include <iostream>

#ifndef NDEBUG
    #define DEBUG_LOG(x) std::cout << x
    #define DEBUG_LOG_ENDL std::endl
#else
    #define DEBUG_LOG(x) ((void)0)
    #define DEBUG_LOG_ENDL ((void)0)
#endif

// Errors are reported in release builds too
#define ERROR_LOG(x) (std::cerr << x << std::endl)
