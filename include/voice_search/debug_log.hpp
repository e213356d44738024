#pragma once

#ifndef NDEBUG
    #include <iostream>
    #define VOICE_SEARCH_DEBUG_LOG(x) std::cout << x
    #define VOICE_SEARCH_DEBUG_LOG_ENDL std::endl
#else
    #define VOICE_SEARCH_DEBUG_LOG(x) ((void)0)
    #define VOICE_SEARCH_DEBUG_LOG_ENDL ((void)0)
#endif
