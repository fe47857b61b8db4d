#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"

namespace inventory {

struct RunConfig {
    bool includeNetwork = true;
    bool includeGpu = true;
    bool allowInstall = true;
    bool traceEnabled = false;
};

struct PlatformProfile {
    PlatformFamily family = PlatformFamily::Unknown;
    std::vector<std::string> baseTools;
    std::vector<SectionKind> sectionOrder;
};

struct DependencyDecision {
    std::string tool;
    std::string package;
    bool required = true;
    bool present = false;
    bool userChoseInstall = false;
    bool installSucceeded = false;
};

struct RenderedSection {
    SectionKind kind;
    std::string title;
    std::string body;
};

struct Report {
    std::string timestamp;
    std::string label;
    std::vector<RenderedSection> sections;
};

} // namespace inventory
