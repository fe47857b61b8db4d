#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

FieldStrategy osReleaseStrategy()
{
    return {"/etc/os-release", [](const DataSource &source) -> std::optional<std::string> {
                const auto content = source.readFile("/etc/os-release");
                if (!content.has_value()) {
                    return std::nullopt;
                }
                return distributionFromOsRelease(*content);
            }};
}

FieldStrategy freebsdVersionStrategy(const std::string &program,
                                     const std::vector<std::string> &args)
{
    const FieldStrategy inner = commandStrategy(program, args);
    return {inner.name, [inner](const DataSource &source) -> std::optional<std::string> {
                const auto version = inner.probe(source);
                if (!version.has_value() || trim(*version).empty()) {
                    return std::nullopt;
                }
                return "FreeBSD " + trim(*version);
            }};
}

std::vector<FieldStrategy> distributionStrategies(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Linux:
    case PlatformFamily::Unknown:
        return {osReleaseStrategy()};
    case PlatformFamily::FreeBSD:
        return {freebsdVersionStrategy("freebsd-version", {}),
                freebsdVersionStrategy("uname", {"-r"})};
    }
    return {};
}

std::vector<FieldStrategy> timezoneStrategies(PlatformFamily family)
{
    std::vector<FieldStrategy> strategies = {
        commandStrategy("timedatectl", {"show", "--property=Timezone", "--value"}),
        fileStrategy("/etc/timezone"),
    };
    if (family == PlatformFamily::FreeBSD) {
        strategies.push_back(fileStrategy("/var/db/zoneinfo"));
    }
    return strategies;
}

std::string kernelString(const DataSource &source)
{
    const auto kernel = resolveField({commandStrategy("uname", {"-sr"})}, source);
    if (!kernel.has_value()) {
        return "n/a";
    }
    const auto arch = resolveField({commandStrategy("uname", {"-m"})}, source);
    if (!arch.has_value()) {
        return *kernel;
    }
    return *kernel + " " + *arch;
}

} // namespace

std::string OsSection::collect(const SectionContext &context) const
{
    const DataSource &source = context.source;
    std::string out;

    const auto hostname = resolveField({commandStrategy("hostname", {}),
                                        commandStrategy("uname", {"-n"})},
                                       source);
    out += formatKeyValue("Hostname", hostname.value_or("n/a"));

    const auto distribution =
        resolveField(distributionStrategies(context.profile.family), source);
    out += formatKeyValue("Distribution", distribution.value_or("Unknown"));

    out += formatKeyValue("Kernel", kernelString(source));

    const auto uptime = resolveField({commandStrategy("uptime", {"-p"}),
                                      commandStrategy("uptime", {})},
                                     source);
    out += formatKeyValue("Uptime", uptime.value_or("n/a"));

    const auto timezone = resolveField(timezoneStrategies(context.profile.family), source);
    out += formatKeyValue("Timezone", timezone.value_or("n/a"));

    return out;
}

} // namespace inventory
