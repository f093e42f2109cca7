/*
 * Fallback version header for flocker
 *
 * CMake passes FLOCKER_VERSION_* definitions from project(VERSION); these
 * defaults only apply when the header is used outside that build.
 */

#pragma once

#ifndef FLOCKER_VERSION_MAJOR
#define FLOCKER_VERSION_MAJOR 0
#endif

#ifndef FLOCKER_VERSION_MINOR
#define FLOCKER_VERSION_MINOR 0
#endif

#ifndef FLOCKER_VERSION_PATCH
#define FLOCKER_VERSION_PATCH 0
#endif

#ifndef FLOCKER_VERSION_STRING
#define FLOCKER_VERSION_STRING "0.0.0+dev"
#endif

#ifndef FLOCKER_BUILD_DATE
#define FLOCKER_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: Mon DD YYYY HH:MM:SS)"
#ifndef FLOCKER_VERSION_LONG_STRING
#define FLOCKER_VERSION_LONG_STRING FLOCKER_VERSION_STRING " (built: " FLOCKER_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace flocker {
namespace version {
constexpr int major_v = FLOCKER_VERSION_MAJOR;
constexpr int minor_v = FLOCKER_VERSION_MINOR;
constexpr int patch_v = FLOCKER_VERSION_PATCH;
constexpr const char* string_v = FLOCKER_VERSION_STRING;
constexpr const char* long_string_v = FLOCKER_VERSION_LONG_STRING;
} // namespace version
} // namespace flocker
#endif
