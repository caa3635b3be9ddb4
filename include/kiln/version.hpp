/*
 * Version macros for kiln.
 *
 * The build system defines KILN_VERSION_* from the project version and
 * KILN_GIT_COMMIT when it is known; the defaults below apply otherwise.
 */

#pragma once

#ifndef KILN_VERSION_MAJOR
#define KILN_VERSION_MAJOR 0
#endif

#ifndef KILN_VERSION_MINOR
#define KILN_VERSION_MINOR 1
#endif

#ifndef KILN_VERSION_PATCH
#define KILN_VERSION_PATCH 0
#endif

#ifndef KILN_VERSION_STRING
#define KILN_VERSION_STRING "0.1.0"
#endif

// Empty for releases, "dev" for development builds.
#ifndef KILN_VERSION_PRERELEASE
#define KILN_VERSION_PRERELEASE "dev"
#endif

#ifndef KILN_GIT_COMMIT
#define KILN_GIT_COMMIT "unknown"
#endif

#ifndef KILN_BUILD_DATE
#define KILN_BUILD_DATE __DATE__ " " __TIME__
#endif

#if defined(__cplusplus)
namespace kiln {
namespace version {
constexpr int major_v = KILN_VERSION_MAJOR;
constexpr int minor_v = KILN_VERSION_MINOR;
constexpr int patch_v = KILN_VERSION_PATCH;
constexpr const char* string_v = KILN_VERSION_STRING;
constexpr const char* prerelease_v = KILN_VERSION_PRERELEASE;
constexpr const char* commit_v = KILN_GIT_COMMIT;
constexpr const char* build_date_v = KILN_BUILD_DATE;
} // namespace version
} // namespace kiln
#endif
