#include "core/dependency_resolver.hpp"

#include <cctype>
#include <ostream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/package_manager.hpp"

namespace inventory {

namespace {

std::string normalizeAnswer(const std::string &answer)
{
    size_t start = 0;
    while (start < answer.size()
           && std::isspace(static_cast<unsigned char>(answer[start]))) {
        ++start;
    }
    size_t end = answer.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(answer[end - 1]))) {
        --end;
    }

    std::string lowered = answer.substr(start, end - start);
    for (auto &ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return lowered;
}

std::vector<std::string> withElevation(Elevation elevation,
                                       std::vector<std::string> command)
{
    const std::string wrapper = toElevationString(elevation);
    if (!wrapper.empty()) {
        command.insert(command.begin(), wrapper);
    }
    return command;
}

std::string joinCommand(const std::vector<std::string> &argv)
{
    std::string out;
    for (const auto &part : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += part;
    }
    return out;
}

} // namespace

InstallAction decideInstallAction(const std::optional<std::string> &answer,
                                  PackageManager manager)
{
    if (manager == PackageManager::None || !answer.has_value()) {
        return InstallAction::Skip;
    }

    const std::string normalized = normalizeAnswer(*answer);
    if (normalized == "y" || normalized == "yes") {
        return InstallAction::Install;
    }
    return InstallAction::Skip;
}

Elevation selectElevation(PlatformFamily family, const ToolAvailability &tools,
                          bool privileged)
{
    if (privileged) {
        return Elevation::None;
    }

    switch (family) {
    case PlatformFamily::FreeBSD:
        if (!tools.exists("sudo") && tools.exists("doas")) {
            return Elevation::Doas;
        }
        return Elevation::Sudo;
    case PlatformFamily::Linux:
    case PlatformFamily::Unknown:
        return Elevation::Sudo;
    }
    return Elevation::Sudo;
}

std::vector<std::string> installCommand(PackageManager manager,
                                        const std::string &package,
                                        Elevation elevation)
{
    switch (manager) {
    case PackageManager::Apt:
    case PackageManager::AptGet:
    case PackageManager::Dnf:
    case PackageManager::Yum:
    case PackageManager::Pkg:
        return withElevation(elevation,
                             {toPackageManagerString(manager), "install", "-y", package});
    case PackageManager::Zypper:
        return withElevation(elevation,
                             {"zypper", "--non-interactive", "install", package});
    case PackageManager::Pacman:
        // Sync database refresh on every invocation.
        return withElevation(elevation, {"pacman", "-Sy", "--noconfirm", package});
    case PackageManager::None:
        return {};
    }
    return {};
}

std::vector<std::string> indexRefreshCommand(PackageManager manager,
                                             Elevation elevation)
{
    if (!isAptFamily(manager)) {
        return {};
    }
    return withElevation(elevation, {toPackageManagerString(manager), "update"});
}

DependencyResolver::DependencyResolver(PlatformFamily family,
                                       PackageManager manager,
                                       const ToolAvailability &tools,
                                       InstallRunner &runner,
                                       AnswerSource &answers,
                                       bool privileged,
                                       std::ostream &err)
    : m_family(family)
    , m_manager(manager)
    , m_tools(tools)
    , m_runner(runner)
    , m_answers(answers)
    , m_privileged(privileged)
    , m_err(err)
{
}

DependencyDecision DependencyResolver::ensure(const std::string &tool, bool allowInstall)
{
    DependencyDecision decision;
    decision.tool = tool;
    decision.package = packageForTool(tool, m_family);

    if (m_tools.exists(tool)) {
        decision.present = true;
        return decision;
    }

    if (!allowInstall) {
        m_err << "Warning: '" << tool << "' unavailable; skip-install mode active."
              << std::endl;
        ILOG_WARN(QStringLiteral("DependencyResolver"),
                  QStringLiteral("ensure"),
                  QStringLiteral("tool_missing"),
                  QStringLiteral("skip_install_mode"),
                  QStringLiteral("path_lookup"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"decision", decision}}));
        return decision;
    }

    m_err << "Dependency '" << tool << "' is missing." << std::endl;

    if (m_manager == PackageManager::None) {
        m_err << "Missing command '" << tool << "'. Install package '"
              << decision.package << "' manually and rerun." << std::endl;
        ILOG_WARN(QStringLiteral("DependencyResolver"),
                  QStringLiteral("ensure"),
                  QStringLiteral("tool_missing"),
                  QStringLiteral("no_package_manager"),
                  QStringLiteral("manual_install_hint"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"decision", decision}}));
        return decision;
    }

    const std::string managerName = toPackageManagerString(m_manager);
    const auto answer = m_answers.ask("Install package '" + decision.package + "' with "
                                      + managerName + " to enable '" + tool + "'? [y/N]: ");

    if (decideInstallAction(answer, m_manager) == InstallAction::Skip) {
        m_err << "Skipping installation of '" << decision.package
              << "'. Some sections may be incomplete." << std::endl;
        ILOG_INFO(QStringLiteral("DependencyResolver"),
                  QStringLiteral("ensure"),
                  QStringLiteral("install_declined"),
                  QStringLiteral("user_answer"),
                  QStringLiteral("prompt"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"decision", decision}}));
        return decision;
    }

    decision.userChoseInstall = true;
    const bool commandOk = install(decision.package);

    decision.present = m_tools.exists(tool);
    decision.installSucceeded = commandOk && decision.present;
    if (!decision.present) {
        m_err << "  -> '" << tool << "' still unavailable after attempted install."
              << std::endl;
        ILOG_WARN(QStringLiteral("DependencyResolver"),
                  QStringLiteral("ensure"),
                  QStringLiteral("install_failed"),
                  QStringLiteral("tool_absent_after_install"),
                  QStringLiteral("path_lookup"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"decision", decision}}));
    } else {
        ILOG_INFO(QStringLiteral("DependencyResolver"),
                  QStringLiteral("ensure"),
                  QStringLiteral("install_completed"),
                  QStringLiteral("user_answer"),
                  QStringLiteral("package_manager"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"decision", decision}}));
    }
    return decision;
}

std::vector<DependencyDecision> DependencyResolver::resolveAll(
    const std::vector<std::string> &tools, bool allowInstall)
{
    std::vector<DependencyDecision> decisions;
    decisions.reserve(tools.size());
    for (const auto &tool : tools) {
        decisions.push_back(ensure(tool, allowInstall));
    }
    return decisions;
}

bool DependencyResolver::install(const std::string &package)
{
    std::lock_guard<std::mutex> lock(m_installMutex);

    const Elevation elevation = selectElevation(m_family, m_tools, m_privileged);

    if (!m_indexRefreshed) {
        const auto refresh = indexRefreshCommand(m_manager, elevation);
        if (!refresh.empty()) {
            // Attempted once per run even if it fails.
            m_indexRefreshed = true;
            const int refreshExit = m_runner.run(refresh);
            ILOG_INFO(QStringLiteral("DependencyResolver"),
                      QStringLiteral("install"),
                      QStringLiteral("package_index_refresh"),
                      QStringLiteral("first_apt_install"),
                      QString::fromStdString(joinCommand(refresh)),
                      inventory::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"exitCode", refreshExit}}));
        }
    }

    const auto command = installCommand(m_manager, package, elevation);
    if (command.empty()) {
        m_err << "Package manager '" << toPackageManagerString(m_manager)
              << "' not handled automatically. Install '" << package
              << "' manually." << std::endl;
        return false;
    }

    const int exitCode = m_runner.run(command);
    ILOG_INFO(QStringLiteral("DependencyResolver"),
              QStringLiteral("install"),
              QStringLiteral("package_install"),
              QStringLiteral("user_answer"),
              QString::fromStdString(joinCommand(command)),
              inventory::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"package", package}, {"exitCode", exitCode}}));
    return exitCode == 0;
}

} // namespace inventory
