#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

struct MemoryFigures {
    std::uint64_t total = 0;
    std::uint64_t available = 0;
    std::uint64_t swap = 0;
};

std::optional<std::uint64_t> sysctlNumber(const DataSource &source, const std::string &key)
{
    const auto output = source.run("sysctl", {"-n", key});
    if (!output.has_value()) {
        return std::nullopt;
    }
    return parseUnsigned(*output);
}

std::optional<MemoryFigures> fromMeminfo(const DataSource &source)
{
    const auto meminfo = source.readFile("/proc/meminfo");
    if (!meminfo.has_value()) {
        return std::nullopt;
    }
    MemoryFigures figures;
    figures.total = meminfoBytes(*meminfo, "MemTotal").value_or(0);
    figures.available = meminfoBytes(*meminfo, "MemAvailable").value_or(0);
    figures.swap = meminfoBytes(*meminfo, "SwapTotal").value_or(0);
    return figures;
}

std::optional<MemoryFigures> fromSysctl(const DataSource &source)
{
    if (!source.exists("sysctl")) {
        return std::nullopt;
    }
    const auto physmem = sysctlNumber(source, "hw.physmem");
    if (!physmem.has_value()) {
        return std::nullopt;
    }

    MemoryFigures figures;
    figures.total = *physmem;

    const auto pageSize = sysctlNumber(source, "hw.pagesize");
    const auto freePages = sysctlNumber(source, "vm.stats.vm.v_free_count");
    const auto inactivePages = sysctlNumber(source, "vm.stats.vm.v_inactive_count");
    if (pageSize.has_value() && freePages.has_value()) {
        figures.available = (*freePages + inactivePages.value_or(0)) * *pageSize;
    }

    if (source.exists("swapinfo")) {
        const auto swapinfo = source.run("swapinfo", {"-k"});
        if (swapinfo.has_value()) {
            figures.swap = swapinfoTotalBytes(*swapinfo).value_or(0);
        }
    }
    return figures;
}

std::string render(const MemoryFigures &figures)
{
    std::string out;
    out += formatKeyValue("RAM Total", bytesToGiB(figures.total));
    out += formatKeyValue("RAM Available", bytesToGiB(figures.available));
    out += formatKeyValue("Swap Total", bytesToGiB(figures.swap));
    return out;
}

} // namespace

std::string MemorySection::collect(const SectionContext &context) const
{
    std::optional<MemoryFigures> figures;
    switch (context.profile.family) {
    case PlatformFamily::Linux:
    case PlatformFamily::Unknown:
        figures = fromMeminfo(context.source);
        break;
    case PlatformFamily::FreeBSD:
        figures = fromSysctl(context.source);
        break;
    }

    if (!figures.has_value()) {
        return render(MemoryFigures{})
            + formatKeyValue("Status", "Cannot read memory information");
    }
    return render(*figures);
}

} // namespace inventory
