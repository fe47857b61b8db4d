#include "sections/sections.hpp"

#include "sections/text_parsers.hpp"

namespace inventory {

namespace {

FieldStrategy lscpuStrategy()
{
    return {"lscpu", [](const DataSource &source) -> std::optional<std::string> {
                if (!source.exists("lscpu")) {
                    return std::nullopt;
                }
                const auto output = source.run("lscpu", {});
                if (!output.has_value() || !colonField(*output, "CPU(s)").has_value()) {
                    return std::nullopt;
                }
                std::string out;
                out += formatKeyValue("Model", colonField(*output, "Model name").value_or(""));
                out += formatKeyValue("Architecture",
                                      colonField(*output, "Architecture").value_or(""));
                out += formatKeyValue("Cores", colonField(*output, "CPU(s)").value_or(""));
                out += formatKeyValue("Threads/Core",
                                      colonField(*output, "Thread(s) per core").value_or(""));
                out += formatKeyValue("Sockets", colonField(*output, "Socket(s)").value_or(""));
                return out;
            }};
}

FieldStrategy cpuinfoStrategy()
{
    return {"/proc/cpuinfo", [](const DataSource &source) -> std::optional<std::string> {
                const auto cpuinfo = source.readFile("/proc/cpuinfo");
                if (!cpuinfo.has_value()) {
                    return std::nullopt;
                }
                const int count = cpuinfoProcessorCount(*cpuinfo);
                std::string out;
                out += formatKeyValue("Model", cpuinfoModel(*cpuinfo).value_or(""));
                out += formatKeyValue("Logical CPUs", count > 0 ? std::to_string(count) : "");
                return out;
            }};
}

FieldStrategy sysctlStrategy()
{
    return {"sysctl hw.*", [](const DataSource &source) -> std::optional<std::string> {
                if (!source.exists("sysctl")) {
                    return std::nullopt;
                }
                const auto ncpu = source.run("sysctl", {"-n", "hw.ncpu"});
                if (!ncpu.has_value()) {
                    return std::nullopt;
                }
                const auto model = source.run("sysctl", {"-n", "hw.model"});
                const auto arch = source.run("sysctl", {"-n", "hw.machine_arch"});
                std::string out;
                out += formatKeyValue("Model", trim(model.value_or("")));
                out += formatKeyValue("Architecture", trim(arch.value_or("")));
                out += formatKeyValue("Cores", trim(*ncpu));
                return out;
            }};
}

FieldStrategy genericStrategy()
{
    return {"uname/getconf", [](const DataSource &source) -> std::optional<std::string> {
                const auto arch = resolveField({commandStrategy("uname", {"-m"})}, source);
                const auto count = resolveField(
                    {commandStrategy("getconf", {"_NPROCESSORS_ONLN"})}, source);
                if (!arch.has_value() && !count.has_value()) {
                    return std::nullopt;
                }
                std::string out;
                out += formatKeyValue("Architecture", arch.value_or(""));
                out += formatKeyValue("Logical CPUs", count.value_or(""));
                return out;
            }};
}

std::vector<FieldStrategy> cpuStrategies(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Linux:
        return {lscpuStrategy(), cpuinfoStrategy()};
    case PlatformFamily::FreeBSD:
        return {sysctlStrategy(), genericStrategy()};
    case PlatformFamily::Unknown:
        return {lscpuStrategy(), cpuinfoStrategy(), genericStrategy()};
    }
    return {};
}

} // namespace

std::string CpuSection::collect(const SectionContext &context) const
{
    const auto block = resolveBlock(cpuStrategies(context.profile.family), context.source);
    if (!block.has_value()) {
        return formatKeyValue("Model", "") + formatKeyValue("Logical CPUs", "");
    }
    return *block;
}

} // namespace inventory
