#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

std::string padded(const std::string &value, size_t width)
{
    if (value.size() >= width) {
        return value + " ";
    }
    return value + std::string(width - value.size(), ' ');
}

std::string collectLinux(const DataSource &source)
{
    if (!source.exists("lsblk")) {
        return "  lsblk missing; install util-linux to display block devices.\n";
    }
    // -e7 hides loop devices.
    const auto table = resolveBlock(
        {commandStrategy("lsblk",
                         {"-o", "NAME,SIZE,TYPE,FSTYPE,MOUNTPOINT,MODEL,SERIAL", "-e7"})},
        source);
    if (!table.has_value()) {
        return "  lsblk returned no block devices.\n";
    }
    std::string out = *table;
    if (out.back() != '\n') {
        out += '\n';
    }
    return out;
}

std::string collectFreeBsd(const DataSource &source)
{
    if (!source.exists("geom")) {
        return "  geom missing; it ships with the FreeBSD base system.\n";
    }
    const auto listing = source.run("geom", {"disk", "list"});
    if (!listing.has_value()) {
        return "  geom returned no block devices.\n";
    }
    const auto disks = parseGeomDiskList(*listing);
    if (disks.empty()) {
        return "  geom returned no block devices.\n";
    }

    std::string out = padded("NAME", 10) + padded("SIZE", 10) + padded("TYPE", 6)
        + padded("MODEL", 34) + "SERIAL\n";
    for (const auto &disk : disks) {
        out += padded(disk.name, 10) + padded(disk.size, 10) + padded("disk", 6)
            + padded(disk.model, 34) + disk.serial + "\n";
    }
    return out;
}

} // namespace

std::string StorageSection::collect(const SectionContext &context) const
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
