#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

std::string renderRows(const std::string &heading, const std::vector<LinkRow> &rows)
{
    if (rows.empty()) {
        return {};
    }
    std::string out = "  " + heading + ":\n";
    for (const auto &row : rows) {
        out += formatRow(row.name, row.detail);
    }
    return out;
}

std::string collectLinux(const DataSource &source)
{
    if (!source.exists("ip")) {
        return "  ip command missing; install iproute2 to list interfaces.\n";
    }

    std::string out = "  Links:\n";
    const auto links = source.run("ip", {"-o", "link", "show"});
    if (links.has_value()) {
        for (const auto &row : parseIpLinks(*links)) {
            out += formatRow(row.name, row.detail);
        }
    }

    const auto ipv4 = source.run("ip", {"-o", "-4", "addr", "show"});
    if (ipv4.has_value()) {
        out += renderRows("IPv4", parseIpAddresses(*ipv4));
    }
    const auto ipv6 = source.run("ip", {"-o", "-6", "addr", "show"});
    if (ipv6.has_value()) {
        out += renderRows("IPv6", parseIpAddresses(*ipv6));
    }
    return out;
}

// ifconfig has no one-line-per-address mode, so roles are derived from the
// default route and interface name prefixes. Labels are a hint, not routing state.
std::string collectFreeBsd(const DataSource &source)
{
    if (!source.exists("ifconfig")) {
        return "  ifconfig missing; it ships with the FreeBSD base system.\n";
    }
    const auto listing = source.run("ifconfig", {});
    if (!listing.has_value()) {
        return "  ifconfig failed to list interfaces.\n";
    }

    std::string defaultInterface;
    if (source.exists("route")) {
        const auto route = source.run("route", {"-n", "get", "default"});
        if (route.has_value()) {
            defaultInterface = defaultRouteInterface(*route).value_or("");
        }
    }

    const auto interfaces = parseIfconfig(*listing);
    std::vector<LinkRow> links;
    std::vector<LinkRow> ipv4;
    std::vector<LinkRow> ipv6;
    for (const auto &info : interfaces) {
        std::string detail = info.up ? "UP" : "DOWN";
        const std::string role = interfaceRole(info.name, defaultInterface);
        if (!role.empty()) {
            detail += " [" + role + "]";
        }
        links.push_back({info.name, detail});
        for (const auto &address : info.ipv4) {
            ipv4.push_back({info.name, address});
        }
        for (const auto &address : info.ipv6) {
            ipv6.push_back({info.name, address});
        }
    }

    std::string out;
    if (!defaultInterface.empty()) {
        out += formatKeyValue("Default route", defaultInterface);
    }
    out += "  Links:\n";
    for (const auto &row : links) {
        out += formatRow(row.name, row.detail);
    }
    out += renderRows("IPv4", ipv4);
    out += renderRows("IPv6", ipv6);
    return out;
}

} // namespace

std::string NetworkSection::collect(const SectionContext &context) const
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
