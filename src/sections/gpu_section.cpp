#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

std::string renderDevices(const std::vector<std::string> &devices)
{
    if (devices.empty()) {
        return "  No display controllers found.\n";
    }
    std::string out;
    for (const auto &device : devices) {
        out += device + "\n";
    }
    return out;
}

std::string collectLinux(const DataSource &source)
{
    if (!source.exists("lspci")) {
        return "  lspci missing; install pciutils to detect GPUs.\n";
    }
    const auto listing = source.run("lspci", {});
    if (!listing.has_value()) {
        return "  lspci failed to enumerate PCI devices.\n";
    }
    return renderDevices(filterDisplayControllers(*listing));
}

std::string collectFreeBsd(const DataSource &source)
{
    if (!source.exists("pciconf")) {
        return "  pciconf missing; it ships with the FreeBSD base system.\n";
    }
    const auto listing = source.run("pciconf", {"-lv"});
    if (!listing.has_value()) {
        return "  pciconf failed to enumerate PCI devices.\n";
    }
    std::vector<std::string> devices;
    for (const auto &device : pciconfDisplayDevices(*listing)) {
        devices.push_back("  " + device);
    }
    return renderDevices(devices);
}

} // namespace

std::string GpuSection::collect(const SectionContext &context) const
{
    switch (context.profile.family) {
    case PlatformFamily::Linux:
        return collectLinux(context.source);
    case PlatformFamily::FreeBSD:
        return collectFreeBsd(context.source);
    case PlatformFamily::Unknown:
        return unsupportedPlatformLine(context.profile.family);
    }
    return unsupportedPlatformLine(context.profile.family);
}

} // namespace inventory
