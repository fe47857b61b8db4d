#include "sections/section_collector.hpp"

#include <cstdio>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sections/sections.hpp"
#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

constexpr size_t kKeyColumnWidth = 18;
constexpr size_t kRowNameWidth = 12;

std::string padRight(const std::string &value, size_t width)
{
    if (value.size() >= width) {
        return value;
    }
    return value + std::string(width - value.size(), ' ');
}

} // namespace

std::unique_ptr<SectionCollector> makeCollector(SectionKind kind)
{
    switch (kind) {
    case SectionKind::OS:
        return std::make_unique<OsSection>();
    case SectionKind::Hardware:
        return std::make_unique<HardwareSection>();
    case SectionKind::CPU:
        return std::make_unique<CpuSection>();
    case SectionKind::Memory:
        return std::make_unique<MemorySection>();
    case SectionKind::Storage:
        return std::make_unique<StorageSection>();
    case SectionKind::GPU:
        return std::make_unique<GpuSection>();
    case SectionKind::Network:
        return std::make_unique<NetworkSection>();
    }
    return nullptr;
}

std::optional<std::string> resolveBlock(const std::vector<FieldStrategy> &strategies,
                                        const DataSource &source)
{
    for (const auto &strategy : strategies) {
        if (!strategy.probe) {
            continue;
        }
        const auto value = strategy.probe(source);
        if (!value.has_value() || trim(*value).empty()) {
            continue;
        }
        ILOG_DEBUG(QStringLiteral("SectionCollector"),
                   QStringLiteral("resolveBlock"),
                   QStringLiteral("strategy_accepted"),
                   QStringLiteral("first_usable_result"),
                   QString::fromStdString(strategy.name),
                   inventory::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return value;
    }
    return std::nullopt;
}

std::optional<std::string> resolveField(const std::vector<FieldStrategy> &strategies,
                                        const DataSource &source)
{
    const auto value = resolveBlock(strategies, source);
    if (!value.has_value()) {
        return std::nullopt;
    }
    return trim(*value);
}

std::string formatKeyValue(const std::string &key, const std::string &value)
{
    const std::string shown = value.empty() ? std::string("n/a") : value;
    return "  " + padRight(key + ":", kKeyColumnWidth) + " " + shown + "\n";
}

std::string formatRow(const std::string &name, const std::string &value)
{
    return "    " + padRight(name, kRowNameWidth) + " " + value + "\n";
}

std::string bytesToGiB(std::uint64_t bytes)
{
    if (bytes == 0) {
        return "0 GiB";
    }
    const double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f GiB", gib);
    return buffer;
}

std::string unsupportedPlatformLine(PlatformFamily family)
{
    return "  Not implemented for this OS (" + toPlatformString(family) + ").\n";
}

FieldStrategy commandStrategy(const std::string &program,
                              const std::vector<std::string> &args)
{
    std::string name = program;
    for (const auto &arg : args) {
        name += " " + arg;
    }
    return {name, [program, args](const DataSource &source) -> std::optional<std::string> {
                if (!source.exists(program)) {
                    return std::nullopt;
                }
                return source.run(program, args);
            }};
}

FieldStrategy fileStrategy(const std::string &path)
{
    return {path, [path](const DataSource &source) { return source.readFile(path); }};
}

} // namespace inventory
