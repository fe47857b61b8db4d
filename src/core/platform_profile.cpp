#include "core/platform_profile.hpp"

#include <algorithm>
#include <cctype>

#include <QSysInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace inventory {

namespace {

const std::vector<SectionKind> kSectionOrder = {
    SectionKind::OS,
    SectionKind::Hardware,
    SectionKind::CPU,
    SectionKind::Memory,
    SectionKind::Storage,
    SectionKind::GPU,
    SectionKind::Network,
};

std::vector<std::string> baseToolsFor(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Linux:
        return {"hostname", "uname", "uptime", "lsblk", "lscpu",
                "awk", "sed", "grep", "cat", "date"};
    case PlatformFamily::FreeBSD:
        return {"hostname", "uname", "uptime", "sysctl", "awk", "sed", "grep",
                "cat", "date", "ifconfig", "pciconf", "geom", "kenv", "swapinfo"};
    case PlatformFamily::Unknown:
        return {"hostname", "uname", "uptime", "awk", "sed", "grep", "cat", "date"};
    }
    return {};
}

void appendUnique(std::vector<std::string> &tools, const std::string &tool)
{
    if (std::find(tools.begin(), tools.end(), tool) == tools.end()) {
        tools.push_back(tool);
    }
}

} // namespace

PlatformProfile profileForKernelType(const std::string &kernelType)
{
    std::string lowered = kernelType;
    for (auto &ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    PlatformProfile profile;
    if (lowered == "linux") {
        profile.family = PlatformFamily::Linux;
    } else if (lowered == "freebsd") {
        profile.family = PlatformFamily::FreeBSD;
    } else {
        profile.family = PlatformFamily::Unknown;
    }
    profile.baseTools = baseToolsFor(profile.family);
    profile.sectionOrder = kSectionOrder;
    return profile;
}

PlatformProfile resolvePlatform()
{
    const std::string kernelType = QSysInfo::kernelType().toStdString();
    const PlatformProfile profile = profileForKernelType(kernelType);

    if (profile.family == PlatformFamily::Unknown) {
        ILOG_WARN(QStringLiteral("PlatformProfile"),
                  QStringLiteral("resolvePlatform"),
                  QStringLiteral("platform_unknown"),
                  QStringLiteral("unrecognised_kernel_type"),
                  QStringLiteral("qsysinfo_kernel_type"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"kernelType", kernelType}}));
    } else {
        ILOG_INFO(QStringLiteral("PlatformProfile"),
                  QStringLiteral("resolvePlatform"),
                  QStringLiteral("platform_resolved"),
                  QStringLiteral("startup"),
                  QStringLiteral("qsysinfo_kernel_type"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"kernelType", kernelType},
                                  {"profile", profile}}));
    }
    return profile;
}

std::vector<SectionKind> enabledSections(const PlatformProfile &profile,
                                         const RunConfig &config)
{
    std::vector<SectionKind> sections;
    for (const SectionKind kind : profile.sectionOrder) {
        if (kind == SectionKind::GPU && !config.includeGpu) {
            continue;
        }
        if (kind == SectionKind::Network && !config.includeNetwork) {
            continue;
        }
        sections.push_back(kind);
    }
    return sections;
}

std::vector<std::string> requiredTools(const PlatformProfile &profile,
                                       const RunConfig &config)
{
    std::vector<std::string> tools;
    for (const auto &tool : profile.baseTools) {
        appendUnique(tools, tool);
    }

    switch (profile.family) {
    case PlatformFamily::Linux:
        if (config.includeNetwork) {
            appendUnique(tools, "ip");
        }
        if (config.includeGpu) {
            appendUnique(tools, "lspci");
        }
        break;
    case PlatformFamily::FreeBSD:
        if (config.includeGpu) {
            appendUnique(tools, "pciconf");
        }
        break;
    case PlatformFamily::Unknown:
        break;
    }

    // Only used opportunistically for the serial number, but always checked.
    appendUnique(tools, "dmidecode");
    return tools;
}

} // namespace inventory
