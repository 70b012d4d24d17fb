/*
 * Version macros for SceneLink
 *
 * The build passes SCENELINK_VERSION_* definitions from project(VERSION ...); these
 * fallbacks keep the header usable when it is compiled outside that build.
 */

#pragma once

#ifndef SCENELINK_VERSION_MAJOR
#define SCENELINK_VERSION_MAJOR 0
#endif

#ifndef SCENELINK_VERSION_MINOR
#define SCENELINK_VERSION_MINOR 0
#endif

#ifndef SCENELINK_VERSION_PATCH
#define SCENELINK_VERSION_PATCH 0
#endif

#ifndef SCENELINK_VERSION_STRING
#define SCENELINK_VERSION_STRING "0.0.0+dev"
#endif

#ifndef SCENELINK_BUILD_DATE
#define SCENELINK_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: Mon DD YYYY HH:MM:SS)"
#ifndef SCENELINK_VERSION_LONG_STRING
#define SCENELINK_VERSION_LONG_STRING SCENELINK_VERSION_STRING " (built: " SCENELINK_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace scenelink {
namespace version {
constexpr int major_v = SCENELINK_VERSION_MAJOR;
constexpr int minor_v = SCENELINK_VERSION_MINOR;
constexpr int patch_v = SCENELINK_VERSION_PATCH;
constexpr const char* string_v = SCENELINK_VERSION_STRING;
constexpr const char* long_string_v = SCENELINK_VERSION_LONG_STRING;
} // namespace version
} // namespace scenelink
#endif
