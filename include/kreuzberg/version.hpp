/*
 * Version header for Kreuzberg
 *
 * The build system may define these macros on the command line; otherwise the
 * values below are used. The same macros are visible from C through
 * kreuzberg/kreuzberg.h.
 */

#pragma once

#ifndef KREUZBERG_VERSION_MAJOR
#define KREUZBERG_VERSION_MAJOR 4
#endif

#ifndef KREUZBERG_VERSION_MINOR
#define KREUZBERG_VERSION_MINOR 0
#endif

#ifndef KREUZBERG_VERSION_PATCH
#define KREUZBERG_VERSION_PATCH 0
#endif

#define KREUZBERG_STRINGIFY_IMPL(x) #x
#define KREUZBERG_STRINGIFY(x) KREUZBERG_STRINGIFY_IMPL(x)

// Combined version string
#ifndef KREUZBERG_VERSION
#define KREUZBERG_VERSION                                                                          \
    KREUZBERG_STRINGIFY(KREUZBERG_VERSION_MAJOR)                                                   \
    "." KREUZBERG_STRINGIFY(KREUZBERG_VERSION_MINOR) "." KREUZBERG_STRINGIFY(KREUZBERG_VERSION_PATCH)
#endif

#if defined(__cplusplus)
namespace kreuzberg {
namespace version {
constexpr int major_v = KREUZBERG_VERSION_MAJOR;
constexpr int minor_v = KREUZBERG_VERSION_MINOR;
constexpr int patch_v = KREUZBERG_VERSION_PATCH;
constexpr const char* string_v = KREUZBERG_VERSION;
} // namespace version
} // namespace kreuzberg
#endif
