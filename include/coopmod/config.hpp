#pragma once

// =============================================================================
// Platform detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifndef COOPMOD_PLATFORM_WINDOWS
        #define COOPMOD_PLATFORM_WINDOWS
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #ifndef COOPMOD_PLATFORM_MACOS
        #define COOPMOD_PLATFORM_MACOS
    #endif
#elif defined(__linux__)
    #ifndef COOPMOD_PLATFORM_LINUX
        #define COOPMOD_PLATFORM_LINUX
    #endif
#endif

// =============================================================================
// Event loop backend detection
// =============================================================================

// Only the epoll backend (eventfd wake-up + timerfd timers) is provided.
// make_io_context() throws on platforms without one.
#ifdef COOPMOD_PLATFORM_LINUX
    #ifndef COOPMOD_HAS_EPOLL
        #define COOPMOD_HAS_EPOLL
    #endif
#endif

// =============================================================================
// Logging
// =============================================================================

// Environment variable read by logger::init_from_env()
#ifndef COOPMOD_LOG_LEVEL_ENV
    #define COOPMOD_LOG_LEVEL_ENV "COOPMOD_LOG_LEVEL"
#endif
