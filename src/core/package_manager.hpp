#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"
#include "core/host_system.hpp"

namespace inventory {

// Detection order, Debian-family first. Changing it changes which manager
// wins on hosts that carry several.
const std::vector<PackageManager> &packageManagerPriority();

/**
 * Return the first manager in packageManagerPriority() whose binary exists,
 * or PackageManager::None.
 */
PackageManager detectPackageManager(const ToolAvailability &tools);

// Package providing `tool` on `family`; the tool name itself when unmapped.
std::string packageForTool(const std::string &tool, PlatformFamily family);

bool isAptFamily(PackageManager manager);

} // namespace inventory
