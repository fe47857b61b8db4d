#include "core/package_manager.hpp"

#include <map>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace inventory {

namespace {

const std::map<std::string, std::string> &linuxPackageMap()
{
    static const std::map<std::string, std::string> map = {
        {"lsblk", "util-linux"},
        {"lscpu", "util-linux"},
        {"lspci", "pciutils"},
        {"ip", "iproute2"},
        {"dmidecode", "dmidecode"},
    };
    return map;
}

// Everything else FreeBSD needs ships in the base system.
const std::map<std::string, std::string> &freebsdPackageMap()
{
    static const std::map<std::string, std::string> map = {
        {"dmidecode", "dmidecode"},
    };
    return map;
}

} // namespace

const std::vector<PackageManager> &packageManagerPriority()
{
    static const std::vector<PackageManager> order = {
        PackageManager::Apt,
        PackageManager::AptGet,
        PackageManager::Dnf,
        PackageManager::Yum,
        PackageManager::Pacman,
        PackageManager::Zypper,
        PackageManager::Pkg,
    };
    return order;
}

PackageManager detectPackageManager(const ToolAvailability &tools)
{
    for (const PackageManager candidate : packageManagerPriority()) {
        if (tools.exists(toPackageManagerString(candidate))) {
            ILOG_INFO(QStringLiteral("PackageManagerResolver"),
                      QStringLiteral("detectPackageManager"),
                      QStringLiteral("package_manager_selected"),
                      QStringLiteral("first_match_in_priority"),
                      QStringLiteral("path_lookup"),
                      inventory::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"manager", candidate}}));
            return candidate;
        }
    }

    ILOG_WARN(QStringLiteral("PackageManagerResolver"),
              QStringLiteral("detectPackageManager"),
              QStringLiteral("package_manager_missing"),
              QStringLiteral("no_candidate_on_path"),
              QStringLiteral("path_lookup"),
              inventory::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    return PackageManager::None;
}

std::string packageForTool(const std::string &tool, PlatformFamily family)
{
    const std::map<std::string, std::string> *map = nullptr;
    switch (family) {
    case PlatformFamily::Linux:
    case PlatformFamily::Unknown:
        map = &linuxPackageMap();
        break;
    case PlatformFamily::FreeBSD:
        map = &freebsdPackageMap();
        break;
    }

    if (map) {
        const auto it = map->find(tool);
        if (it != map->end()) {
            return it->second;
        }
    }
    return tool;
}

bool isAptFamily(PackageManager manager)
{
    return manager == PackageManager::Apt || manager == PackageManager::AptGet;
}

} // namespace inventory
