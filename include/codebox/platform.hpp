#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Centralized platform detection macros.
// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define CODEBOX_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define CODEBOX_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define CODEBOX_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define CODEBOX_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || CODEBOX_PLATFORM_MACOS || CODEBOX_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define CODEBOX_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define CODEBOX_PLATFORM_POSIX 0
#endif

#if !CODEBOX_PLATFORM_POSIX
#error "codebox supervises POSIX processes only"
#endif

#if __cplusplus < 202002L
#error "codebox requires at least C++20"
#endif
