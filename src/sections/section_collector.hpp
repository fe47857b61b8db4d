#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/host_system.hpp"

namespace inventory {

struct SectionContext {
    const PlatformProfile &profile;
    const RunConfig &config;
    const DataSource &source;
};

/**
 * One labelled block of the report.
 *
 * collect() never fails: unreadable sources and missing tools render as
 * "n/a" or an explanatory line so that a partial report is always produced.
 */
class SectionCollector
{
public:
    virtual ~SectionCollector() = default;

    virtual SectionKind kind() const = 0;
    virtual std::string title() const = 0;
    virtual std::string collect(const SectionContext &context) const = 0;
};

std::unique_ptr<SectionCollector> makeCollector(SectionKind kind);

// One step of a fallback chain. A probe result counts only when it holds
// non-blank text.
struct FieldStrategy {
    std::string name;
    std::function<std::optional<std::string>(const DataSource &)> probe;
};

// Tries each strategy in order and returns the first usable (trimmed) result.
std::optional<std::string> resolveField(const std::vector<FieldStrategy> &strategies,
                                        const DataSource &source);

// Same chain semantics, but the accepted text is returned untouched so
// preformatted multi-line blocks keep their layout.
std::optional<std::string> resolveBlock(const std::vector<FieldStrategy> &strategies,
                                        const DataSource &source);

// "  Key:               value\n"; empty values render as "n/a".
std::string formatKeyValue(const std::string &key, const std::string &value);

// "    name         value\n", the row layout used under sub-headings.
std::string formatRow(const std::string &name, const std::string &value);

// Base-1024^3, two decimals; zero renders as "0 GiB".
std::string bytesToGiB(std::uint64_t bytes);

std::string unsupportedPlatformLine(PlatformFamily family);

// Strategies shared by several sections.
FieldStrategy commandStrategy(const std::string &program,
                              const std::vector<std::string> &args);
FieldStrategy fileStrategy(const std::string &path);

} // namespace inventory
