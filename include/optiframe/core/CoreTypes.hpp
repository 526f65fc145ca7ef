#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Version information and naming helpers for Optiframe
 */

#include <string>

namespace optiframe {

// =============================================================================
// Version Information
// =============================================================================

// Single source of truth for version numbers
#define OPTIFRAME_VERSION_MAJOR 0
#define OPTIFRAME_VERSION_MINOR 3
#define OPTIFRAME_VERSION_PATCH 0

// Stringify helper
#define OPTIFRAME_STRINGIFY(x) #x
#define OPTIFRAME_VERSION_STR(major, minor, patch)                                                 \
    OPTIFRAME_STRINGIFY(major) "." OPTIFRAME_STRINGIFY(minor) "." OPTIFRAME_STRINGIFY(patch)

/// Major version number
constexpr int VersionMajor() { return OPTIFRAME_VERSION_MAJOR; }

/// Minor version number
constexpr int VersionMinor() { return OPTIFRAME_VERSION_MINOR; }

/// Patch version number
constexpr int VersionPatch() { return OPTIFRAME_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return OPTIFRAME_VERSION_STR(OPTIFRAME_VERSION_MAJOR, OPTIFRAME_VERSION_MINOR,
                                 OPTIFRAME_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a full path from step and task name
 *
 * Returns "step.task" if step is non-empty, otherwise just "task".
 * Used consistently across logging, diagnostics and graph export.
 */
inline std::string MakeFullPath(const std::string &step, const std::string &task) {
    if (step.empty())
        return task;
    return step + "." + task;
}

} // namespace optiframe
