#pragma once

// seqnet Configuration Header
// Version and platform detection

// Version information
#define SEQNET_VERSION_MAJOR 0
#define SEQNET_VERSION_MINOR 1
#define SEQNET_VERSION_PATCH 0
#define SEQNET_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #define SEQNET_PLATFORM_WINDOWS 1
    #define SEQNET_PLATFORM_LINUX 0
    #define SEQNET_PLATFORM_MACOS 0
#elif defined(__linux__)
    #define SEQNET_PLATFORM_WINDOWS 0
    #define SEQNET_PLATFORM_LINUX 1
    #define SEQNET_PLATFORM_MACOS 0
#elif defined(__APPLE__)
    #define SEQNET_PLATFORM_WINDOWS 0
    #define SEQNET_PLATFORM_LINUX 0
    #define SEQNET_PLATFORM_MACOS 1
#else
    #define SEQNET_PLATFORM_WINDOWS 0
    #define SEQNET_PLATFORM_LINUX 0
    #define SEQNET_PLATFORM_MACOS 0
#endif

// Default seed used by every Generator that is not given one explicitly
#define SEQNET_DEFAULT_SEED 42u
