#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace inventory {

// Maps a kernel type ("linux", "freebsd", ...) to its profile. Anything
// unrecognised, including an empty string, resolves to Unknown.
PlatformProfile profileForKernelType(const std::string &kernelType);

/**
 * Probe the running kernel once and return its profile.
 * Identification never fails hard; it degrades to PlatformFamily::Unknown.
 */
PlatformProfile resolvePlatform();

// Sections to run for this profile, already filtered by the GPU/network toggles.
std::vector<SectionKind> enabledSections(const PlatformProfile &profile,
                                         const RunConfig &config);

// baseTools plus the toggle-dependent tools, plus dmidecode. Order is kept,
// duplicates are dropped.
std::vector<std::string> requiredTools(const PlatformProfile &profile,
                                       const RunConfig &config);

} // namespace inventory
