#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inventory {

std::string trim(const std::string &value);
std::string toLower(std::string value);
std::vector<std::string> splitLines(const std::string &text);
std::vector<std::string> splitWhitespace(const std::string &text);

// KEY=value pairs from an os-release file; surrounding quotes are stripped.
std::map<std::string, std::string> parseOsRelease(const std::string &content);

// PRETTY_NAME, else "NAME VERSION_ID", else std::nullopt.
std::optional<std::string> distributionFromOsRelease(const std::string &content);

// Value of "Key: value" lines where the key matches exactly (lscpu style).
std::optional<std::string> colonField(const std::string &text, const std::string &key);

std::optional<std::string> cpuinfoModel(const std::string &cpuinfo);
int cpuinfoProcessorCount(const std::string &cpuinfo);

// /proc/meminfo entry in bytes (source values are kB).
std::optional<std::uint64_t> meminfoBytes(const std::string &meminfo,
                                          const std::string &key);

// Sum of device rows from `swapinfo -k`, in bytes.
std::optional<std::uint64_t> swapinfoTotalBytes(const std::string &swapinfo);

std::optional<std::uint64_t> parseUnsigned(const std::string &text);

// lspci lines naming display-class controllers (vga, 3d, display).
std::vector<std::string> filterDisplayControllers(const std::string &lspci);

// "selector: vendor device" for every display-class device in `pciconf -lv`.
std::vector<std::string> pciconfDisplayDevices(const std::string &pciconf);

struct DiskRow {
    std::string name;
    std::string size;
    std::string model;
    std::string serial;
};

std::vector<DiskRow> parseGeomDiskList(const std::string &geom);

struct LinkRow {
    std::string name;
    std::string detail;
};

// `ip -o link show` -> interface name and the flags/state text that follows.
std::vector<LinkRow> parseIpLinks(const std::string &ipLink);

// `ip -o -4|-6 addr show` -> interface name and CIDR address.
std::vector<LinkRow> parseIpAddresses(const std::string &ipAddr);

struct InterfaceInfo {
    std::string name;
    bool up = false;
    std::vector<std::string> ipv4;
    std::vector<std::string> ipv6;
};

std::vector<InterfaceInfo> parseIfconfig(const std::string &ifconfig);

// "interface:" line of `route -n get default`.
std::optional<std::string> defaultRouteInterface(const std::string &routeGet);

// Best-effort role: "LAN/Default", "Tailscale", "WireGuard", "Tunnel" or "".
std::string interfaceRole(const std::string &name, const std::string &defaultInterface);

// First line containing a known single-board-computer vendor name
// (case-insensitive), with NUL bytes removed.
std::optional<std::string> findBoardModel(const std::string &text);

} // namespace inventory
