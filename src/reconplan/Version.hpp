#pragma once

#include <string>

// Build/version metadata for ReconPlan.
//
// CMake defines these macros for all targets via reconplan_core's PUBLIC compile
// definitions (see CMakeLists.txt). The fallbacks keep the header usable in IDEs
// or non-CMake builds.

#ifndef RECONPLAN_VERSION_MAJOR
#define RECONPLAN_VERSION_MAJOR 0
#endif

#ifndef RECONPLAN_VERSION_MINOR
#define RECONPLAN_VERSION_MINOR 0
#endif

#ifndef RECONPLAN_VERSION_PATCH
#define RECONPLAN_VERSION_PATCH 0
#endif

#ifndef RECONPLAN_VERSION_STRING
#define RECONPLAN_VERSION_STRING "0.0.0"
#endif

namespace reconplan {

struct ReconPlanVersion {
  int major;
  int minor;
  int patch;
};

inline constexpr ReconPlanVersion ReconPlanVersionNumbers()
{
  return ReconPlanVersion{RECONPLAN_VERSION_MAJOR, RECONPLAN_VERSION_MINOR, RECONPLAN_VERSION_PATCH};
}

inline constexpr const char* ReconPlanVersionString()
{
  return RECONPLAN_VERSION_STRING;
}

// "reconplan 1.2.3", used in tool banners and export headers.
inline std::string ReconPlanBanner()
{
  return std::string("reconplan ") + ReconPlanVersionString();
}

} // namespace reconplan
