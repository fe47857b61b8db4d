#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace inventory {

inline std::string toPlatformString(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Linux:
        return "linux";
    case PlatformFamily::FreeBSD:
        return "freebsd";
    case PlatformFamily::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline std::string toSectionString(SectionKind kind)
{
    switch (kind) {
    case SectionKind::OS:
        return "os";
    case SectionKind::Hardware:
        return "hardware";
    case SectionKind::CPU:
        return "cpu";
    case SectionKind::Memory:
        return "memory";
    case SectionKind::Storage:
        return "storage";
    case SectionKind::GPU:
        return "gpu";
    case SectionKind::Network:
        return "network";
    }
    return "os";
}

// Binary name of the manager; empty for PackageManager::None.
inline std::string toPackageManagerString(PackageManager manager)
{
    switch (manager) {
    case PackageManager::Apt:
        return "apt";
    case PackageManager::AptGet:
        return "apt-get";
    case PackageManager::Dnf:
        return "dnf";
    case PackageManager::Yum:
        return "yum";
    case PackageManager::Pacman:
        return "pacman";
    case PackageManager::Zypper:
        return "zypper";
    case PackageManager::Pkg:
        return "pkg";
    case PackageManager::None:
        return "";
    }
    return "";
}

inline std::string toElevationString(Elevation elevation)
{
    switch (elevation) {
    case Elevation::None:
        return "";
    case Elevation::Sudo:
        return "sudo";
    case Elevation::Doas:
        return "doas";
    }
    return "";
}

inline void to_json(nlohmann::json &j, const PlatformFamily &family)
{
    j = toPlatformString(family);
}

inline void to_json(nlohmann::json &j, const SectionKind &kind)
{
    j = toSectionString(kind);
}

inline void to_json(nlohmann::json &j, const PackageManager &manager)
{
    const std::string name = toPackageManagerString(manager);
    j = name.empty() ? std::string("none") : name;
}

inline void to_json(nlohmann::json &j, const RunConfig &config)
{
    j = nlohmann::json{
        {"includeNetwork", config.includeNetwork},
        {"includeGpu", config.includeGpu},
        {"allowInstall", config.allowInstall},
        {"traceEnabled", config.traceEnabled}
    };
}

inline void to_json(nlohmann::json &j, const PlatformProfile &profile)
{
    j = nlohmann::json{
        {"family", profile.family},
        {"baseTools", profile.baseTools},
        {"sectionOrder", profile.sectionOrder}
    };
}

inline void to_json(nlohmann::json &j, const DependencyDecision &decision)
{
    j = nlohmann::json{
        {"tool", decision.tool},
        {"package", decision.package},
        {"required", decision.required},
        {"present", decision.present},
        {"userChoseInstall", decision.userChoseInstall},
        {"installSucceeded", decision.installSucceeded}
    };
}

} // namespace inventory
