#pragma once

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #define DOCKET_PLATFORM_WINDOWS
#elif defined(__APPLE__)
    #define DOCKET_PLATFORM_MACOS
#elif defined(__linux__)
    #define DOCKET_PLATFORM_LINUX
#endif

// Disable copy
#define DOCKET_DISABLE_COPY(ClassName) \
    ClassName(const ClassName&) = delete; \
    ClassName& operator=(const ClassName&) = delete;

// Disable move
#define DOCKET_DISABLE_MOVE(ClassName) \
    ClassName(ClassName&&) = delete; \
    ClassName& operator=(ClassName&&) = delete;

// Disable copy and move
#define DOCKET_DISABLE_COPY_AND_MOVE(ClassName) \
    DOCKET_DISABLE_COPY(ClassName) \
    DOCKET_DISABLE_MOVE(ClassName)
