#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

const std::string kDmiRoot = "/sys/devices/virtual/dmi/id/";
const std::string kSerialHint = "(run with sudo and install dmidecode to fetch serial)";

FieldStrategy dmidecodeSerialStrategy()
{
    return {"dmidecode -s system-serial-number",
            [](const DataSource &source) -> std::optional<std::string> {
                if (!source.isPrivileged() || !source.exists("dmidecode")) {
                    return std::nullopt;
                }
                return source.run("dmidecode", {"-s", "system-serial-number"});
            }};
}

FieldStrategy kenvStrategy(const std::string &key)
{
    return commandStrategy("kenv", {"-q", key});
}

FieldStrategy boardStrategy(const FieldStrategy &inner)
{
    return {inner.name, [inner](const DataSource &source) -> std::optional<std::string> {
                const auto text = inner.probe(source);
                if (!text.has_value()) {
                    return std::nullopt;
                }
                return findBoardModel(*text);
            }};
}

std::vector<FieldStrategy> boardStrategies(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Linux:
        return {boardStrategy(fileStrategy("/proc/device-tree/model")),
                boardStrategy(fileStrategy("/sys/firmware/devicetree/base/model")),
                boardStrategy(fileStrategy("/proc/cpuinfo"))};
    case PlatformFamily::FreeBSD:
        return {boardStrategy(commandStrategy("sysctl", {"-n", "hw.fdt.model"}))};
    case PlatformFamily::Unknown:
        return {};
    }
    return {};
}

std::string collectLinux(const DataSource &source)
{
    std::string out;
    out += formatKeyValue("Vendor",
                          resolveField({fileStrategy(kDmiRoot + "sys_vendor")}, source)
                              .value_or("n/a"));
    out += formatKeyValue("Model",
                          resolveField({fileStrategy(kDmiRoot + "product_name")}, source)
                              .value_or("n/a"));
    out += formatKeyValue("BIOS",
                          resolveField({fileStrategy(kDmiRoot + "bios_version")}, source)
                              .value_or("n/a"));

    const auto serial = resolveField({dmidecodeSerialStrategy(),
                                      fileStrategy(kDmiRoot + "product_serial")},
                                     source);
    out += formatKeyValue("Serial", serial.value_or(kSerialHint));
    return out;
}

std::string collectFreeBsd(const DataSource &source)
{
    std::string out;
    out += formatKeyValue("Vendor",
                          resolveField({kenvStrategy("smbios.system.maker")}, source)
                              .value_or("n/a"));
    out += formatKeyValue("Model",
                          resolveField({kenvStrategy("smbios.system.product")}, source)
                              .value_or("n/a"));
    out += formatKeyValue("BIOS",
                          resolveField({kenvStrategy("smbios.bios.version")}, source)
                              .value_or("n/a"));

    const auto serial = resolveField({dmidecodeSerialStrategy(),
                                      kenvStrategy("smbios.system.serial")},
                                     source);
    out += formatKeyValue("Serial", serial.value_or(kSerialHint));
    return out;
}

} // namespace

std::string HardwareSection::collect(const SectionContext &context) const
{
    std::string out;
    switch (context.profile.family) {
    case PlatformFamily::Linux:
        out = collectLinux(context.source);
        break;
    case PlatformFamily::FreeBSD:
        out = collectFreeBsd(context.source);
        break;
    case PlatformFamily::Unknown:
        return unsupportedPlatformLine(context.profile.family);
    }

    const auto board = resolveField(boardStrategies(context.profile.family), context.source);
    if (board.has_value()) {
        out += formatKeyValue("Board", *board);
    }
    return out;
}

} // namespace inventory
