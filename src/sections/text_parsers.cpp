#include "sections/text_parsers.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace inventory {

namespace {

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.rfind(prefix, 0) == 0;
}

bool isIndented(const std::string &line)
{
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

std::string stripQuotes(std::string value)
{
    value = trim(value);
    if (value.size() >= 2
        && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "    vendor     = 'Intel Corporation'" -> Intel Corporation
std::string assignedValue(const std::string &line)
{
    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return {};
    }
    return stripQuotes(line.substr(eq + 1));
}

std::string assignedKey(const std::string &line)
{
    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return {};
    }
    return trim(line.substr(0, eq));
}

const std::vector<std::string> &boardVendors()
{
    static const std::vector<std::string> vendors = {"raspberry pi"};
    return vendors;
}

} // namespace

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitWhitespace(const std::string &text)
{
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::map<std::string, std::string> parseOsRelease(const std::string &content)
{
    std::map<std::string, std::string> values;
    for (const auto &rawLine : splitLines(content)) {
        const std::string line = trim(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        values[line.substr(0, eq)] = stripQuotes(line.substr(eq + 1));
    }
    return values;
}

std::optional<std::string> distributionFromOsRelease(const std::string &content)
{
    const auto values = parseOsRelease(content);

    const auto pretty = values.find("PRETTY_NAME");
    if (pretty != values.end() && !pretty->second.empty()) {
        return pretty->second;
    }

    const auto name = values.find("NAME");
    const auto version = values.find("VERSION_ID");
    std::string combined;
    if (name != values.end()) {
        combined = name->second;
    }
    if (version != values.end() && !version->second.empty()) {
        if (!combined.empty()) {
            combined += " ";
        }
        combined += version->second;
    }
    if (combined.empty()) {
        return std::nullopt;
    }
    return combined;
}

std::optional<std::string> colonField(const std::string &text, const std::string &key)
{
    for (const auto &line : splitLines(text)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (trim(line.substr(0, colon)) != key) {
            continue;
        }
        const std::string value = trim(line.substr(colon + 1));
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

std::optional<std::string> cpuinfoModel(const std::string &cpuinfo)
{
    return colonField(cpuinfo, "model name");
}

int cpuinfoProcessorCount(const std::string &cpuinfo)
{
    int count = 0;
    for (const auto &line : splitLines(cpuinfo)) {
        if (startsWith(line, "processor")) {
            ++count;
        }
    }
    return count;
}

std::optional<std::uint64_t> parseUnsigned(const std::string &text)
{
    const std::string value = trim(text);
    if (value.empty()
        || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
               return std::isdigit(c);
           })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> meminfoBytes(const std::string &meminfo,
                                          const std::string &key)
{
    const auto field = colonField(meminfo, key);
    if (!field.has_value()) {
        return std::nullopt;
    }
    const auto tokens = splitWhitespace(*field);
    if (tokens.empty()) {
        return std::nullopt;
    }
    const auto kib = parseUnsigned(tokens.front());
    if (!kib.has_value()) {
        return std::nullopt;
    }
    return *kib * 1024ULL;
}

std::optional<std::uint64_t> swapinfoTotalBytes(const std::string &swapinfo)
{
    std::uint64_t totalKib = 0;
    bool sawDevice = false;
    for (const auto &line : splitLines(swapinfo)) {
        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 2 || tokens[0] == "Device" || tokens[0] == "Total") {
            continue;
        }
        const auto blocks = parseUnsigned(tokens[1]);
        if (!blocks.has_value()) {
            continue;
        }
        totalKib += *blocks;
        sawDevice = true;
    }
    if (!sawDevice) {
        return std::nullopt;
    }
    return totalKib * 1024ULL;
}

std::vector<std::string> filterDisplayControllers(const std::string &lspci)
{
    std::vector<std::string> matches;
    for (const auto &line : splitLines(lspci)) {
        const std::string lowered = toLower(line);
        if (lowered.find("vga") != std::string::npos
            || lowered.find("3d") != std::string::npos
            || lowered.find("display") != std::string::npos) {
            matches.push_back(line);
        }
    }
    return matches;
}

std::vector<std::string> pciconfDisplayDevices(const std::string &pciconf)
{
    struct Block {
        std::string selector;
        std::string vendor;
        std::string device;
        bool display = false;
    };

    std::vector<Block> blocks;
    for (const auto &line : splitLines(pciconf)) {
        if (trim(line).empty()) {
            continue;
        }
        if (!isIndented(line)) {
            Block block;
            const size_t at = line.find('@');
            block.selector = trim(line.substr(0, at));
            // Base class 0x03 is "display controller".
            const size_t classPos = line.find("class=0x");
            if (classPos != std::string::npos && classPos + 10 <= line.size()
                && line.compare(classPos + 8, 2, "03") == 0) {
                block.display = true;
            }
            blocks.push_back(block);
            continue;
        }
        if (blocks.empty()) {
            continue;
        }
        Block &current = blocks.back();
        const std::string key = assignedKey(line);
        if (key == "vendor") {
            current.vendor = assignedValue(line);
        } else if (key == "device") {
            current.device = assignedValue(line);
        } else if (key == "class" && toLower(assignedValue(line)) == "display") {
            current.display = true;
        }
    }

    std::vector<std::string> devices;
    for (const auto &block : blocks) {
        if (!block.display) {
            continue;
        }
        std::string text = block.selector + ":";
        if (!block.vendor.empty()) {
            text += " " + block.vendor;
        }
        if (!block.device.empty()) {
            text += " " + block.device;
        }
        devices.push_back(text);
    }
    return devices;
}

std::vector<DiskRow> parseGeomDiskList(const std::string &geom)
{
    std::vector<DiskRow> disks;
    for (const auto &rawLine : splitLines(geom)) {
        const std::string line = trim(rawLine);
        if (startsWith(line, "Geom name:")) {
            DiskRow row;
            row.name = trim(line.substr(10));
            disks.push_back(row);
            continue;
        }
        if (disks.empty()) {
            continue;
        }
        DiskRow &current = disks.back();
        if (startsWith(line, "Mediasize:")) {
            const std::string value = trim(line.substr(10));
            const size_t open = value.find('(');
            const size_t close = value.find(')', open == std::string::npos ? 0 : open);
            if (open != std::string::npos && close != std::string::npos) {
                current.size = value.substr(open + 1, close - open - 1);
            } else {
                current.size = value;
            }
        } else if (startsWith(line, "descr:")) {
            current.model = trim(line.substr(6));
        } else if (startsWith(line, "ident:")) {
            current.serial = trim(line.substr(6));
        }
    }
    return disks;
}

std::vector<LinkRow> parseIpLinks(const std::string &ipLink)
{
    std::vector<LinkRow> rows;
    const std::string separator = ": ";
    for (const auto &line : splitLines(ipLink)) {
        const size_t first = line.find(separator);
        if (first == std::string::npos) {
            continue;
        }
        const size_t nameStart = first + separator.size();
        const size_t second = line.find(separator, nameStart);
        LinkRow row;
        if (second == std::string::npos) {
            row.name = trim(line.substr(nameStart));
        } else {
            row.name = trim(line.substr(nameStart, second - nameStart));
            const size_t detailStart = second + separator.size();
            const size_t third = line.find(separator, detailStart);
            row.detail = trim(line.substr(detailStart,
                                          third == std::string::npos
                                              ? std::string::npos
                                              : third - detailStart));
        }
        if (!row.name.empty()) {
            rows.push_back(row);
        }
    }
    return rows;
}

std::vector<LinkRow> parseIpAddresses(const std::string &ipAddr)
{
    std::vector<LinkRow> rows;
    for (const auto &line : splitLines(ipAddr)) {
        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 4) {
            continue;
        }
        rows.push_back({tokens[1], tokens[3]});
    }
    return rows;
}

std::vector<InterfaceInfo> parseIfconfig(const std::string &ifconfig)
{
    std::vector<InterfaceInfo> interfaces;
    for (const auto &line : splitLines(ifconfig)) {
        if (trim(line).empty()) {
            continue;
        }
        if (!isIndented(line)) {
            const size_t colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            InterfaceInfo info;
            info.name = line.substr(0, colon);
            const size_t open = line.find('<');
            const size_t close = line.find('>', open == std::string::npos ? 0 : open);
            if (open != std::string::npos && close != std::string::npos) {
                std::string flags = line.substr(open + 1, close - open - 1);
                std::replace(flags.begin(), flags.end(), ',', ' ');
                for (const auto &flag : splitWhitespace(flags)) {
                    if (flag == "UP") {
                        info.up = true;
                    }
                }
            }
            interfaces.push_back(info);
            continue;
        }
        if (interfaces.empty()) {
            continue;
        }
        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 2) {
            continue;
        }
        if (tokens[0] == "inet") {
            interfaces.back().ipv4.push_back(tokens[1]);
        } else if (tokens[0] == "inet6") {
            std::string address = tokens[1];
            const size_t scope = address.find('%');
            if (scope != std::string::npos) {
                address.erase(scope);
            }
            interfaces.back().ipv6.push_back(address);
        }
    }
    return interfaces;
}

std::optional<std::string> defaultRouteInterface(const std::string &routeGet)
{
    return colonField(routeGet, "interface");
}

std::string interfaceRole(const std::string &name, const std::string &defaultInterface)
{
    if (!defaultInterface.empty() && name == defaultInterface) {
        return "LAN/Default";
    }
    if (startsWith(name, "tailscale")) {
        return "Tailscale";
    }
    if (startsWith(name, "wg")) {
        return "WireGuard";
    }
    static const std::vector<std::string> tunnelPrefixes = {
        "tun", "tap", "gif", "gre", "ipsec",
    };
    for (const auto &prefix : tunnelPrefixes) {
        if (startsWith(name, prefix)) {
            return "Tunnel";
        }
    }
    return {};
}

std::optional<std::string> findBoardModel(const std::string &text)
{
    std::string cleaned = text;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\0'), cleaned.end());

    for (const auto &line : splitLines(cleaned)) {
        const std::string lowered = toLower(line);
        for (const auto &vendor : boardVendors()) {
            const size_t hit = lowered.find(vendor);
            if (hit == std::string::npos) {
                continue;
            }
            // cpuinfo style "Model : Raspberry Pi 4 ..." keeps only the value.
            const size_t colon = line.find(':');
            if (colon != std::string::npos && colon < hit) {
                return trim(line.substr(colon + 1));
            }
            return trim(line);
        }
    }
    return std::nullopt;
}

} // namespace inventory
