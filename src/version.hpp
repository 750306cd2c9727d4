#pragma once

// Build/version info.
//
// CMake defines LEVELFORGE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef LEVELFORGE_VERSION
#define LEVELFORGE_VERSION "dev"
#endif

#ifndef LEVELFORGE_APPNAME
#define LEVELFORGE_APPNAME "LevelForge"
#endif
