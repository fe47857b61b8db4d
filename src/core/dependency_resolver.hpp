#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/host_system.hpp"

namespace inventory {

// Maps a prompt answer to an action. Only "y"/"yes" (any case, surrounding
// whitespace ignored) installs; empty input, end of input or anything else
// skips. Without a package manager the answer is irrelevant.
InstallAction decideInstallAction(const std::optional<std::string> &answer,
                                  PackageManager manager);

// doas is used on FreeBSD only when sudo is missing and doas is present.
// Root needs no wrapper at all.
Elevation selectElevation(PlatformFamily family, const ToolAvailability &tools,
                          bool privileged);

// Empty when the manager has no automatic install path.
std::vector<std::string> installCommand(PackageManager manager,
                                        const std::string &package,
                                        Elevation elevation);

// Index refresh command; empty for managers that do not need one.
std::vector<std::string> indexRefreshCommand(PackageManager manager,
                                             Elevation elevation);

/**
 * DependencyResolver runs the dependency phase of a report:
 * - checks each required tool
 * - prompts before installing a missing one
 * - runs the apt index refresh at most once for the lifetime of the resolver
 *
 * All user-facing warnings go to the supplied error stream.
 */
class DependencyResolver
{
public:
    DependencyResolver(PlatformFamily family,
                       PackageManager manager,
                       const ToolAvailability &tools,
                       InstallRunner &runner,
                       AnswerSource &answers,
                       bool privileged,
                       std::ostream &err);

    DependencyDecision ensure(const std::string &tool, bool allowInstall);

    std::vector<DependencyDecision> resolveAll(const std::vector<std::string> &tools,
                                               bool allowInstall);

    PackageManager manager() const { return m_manager; }
    bool indexRefreshed() const { return m_indexRefreshed; }

private:
    bool install(const std::string &package);

    PlatformFamily m_family;
    PackageManager m_manager;
    const ToolAvailability &m_tools;
    InstallRunner &m_runner;
    AnswerSource &m_answers;
    bool m_privileged;
    std::ostream &m_err;

    // Guards m_indexRefreshed and keeps package-manager invocations serial.
    std::mutex m_installMutex;
    bool m_indexRefreshed = false;
};

} // namespace inventory
