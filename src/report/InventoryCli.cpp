#include "report/InventoryCli.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/dependency_resolver.hpp"
#include "core/package_manager.hpp"
#include "core/platform_profile.hpp"
#include "report/report_assembler.hpp"

namespace inventory {

namespace {

QString runCorrelationId()
{
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    return QStringLiteral("run-%1").arg(epochMs);
}

} // namespace

QString usageText()
{
    return QStringLiteral(
        "Usage: collect_inventory [--no-network] [--no-gpu] [--skip-install]\n"
        "\n"
        "Creates a hardware/OS inventory report saved to a timestamped .txt file.\n"
        "  --no-network     Skip interface details (avoid needing iproute2).\n"
        "  --no-gpu         Skip GPU detection (avoid needing pciutils).\n"
        "  --skip-install   Do not attempt to install missing helper packages.\n"
        "  --trace          Write debug-level diagnostics to the log directory.\n"
        "  -h, --help       Show this help text.\n");
}

ParsedArguments parseArguments(const QStringList &args)
{
    ParsedArguments parsed;
    parsed.config.traceEnabled = logging::isTraceEnabled();

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--no-network")) {
            parsed.config.includeNetwork = false;
        } else if (arg == QStringLiteral("--no-gpu")) {
            parsed.config.includeGpu = false;
        } else if (arg == QStringLiteral("--skip-install")) {
            parsed.config.allowInstall = false;
        } else if (arg == QStringLiteral("--trace")) {
            parsed.config.traceEnabled = true;
        } else if (arg == QStringLiteral("-h") || arg == QStringLiteral("--help")) {
            parsed.outcome = ParseOutcome::Help;
            return parsed;
        } else {
            parsed.outcome = ParseOutcome::Invalid;
            parsed.invalidArgument = arg;
            return parsed;
        }
    }
    return parsed;
}

InventoryCli::InventoryCli() = default;

InventoryCli::InventoryCli(CliEnvironment environment)
    : m_environment(std::move(environment))
{
}

int InventoryCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    const ParsedArguments parsed = parseArguments(args);
    switch (parsed.outcome) {
    case ParseOutcome::Help:
        std::cout << usageText().toStdString();
        return 0;
    case ParseOutcome::Invalid:
        std::cerr << "Unknown option: " << parsed.invalidArgument.toStdString() << std::endl;
        std::cerr << usageText().toStdString();
        ILOG_WARN(QStringLiteral("InventoryCli"),
                  QStringLiteral("run"),
                  QStringLiteral("invalid_argument"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("cli"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"argument", parsed.invalidArgument.toStdString()}}));
        return 1;
    case ParseOutcome::Run:
        break;
    }

    return runInventory(parsed.config);
}

int InventoryCli::runInventory(const RunConfig &config)
{
    logging::CorrelationScope correlation(runCorrelationId());

    ILOG_INFO(QStringLiteral("InventoryCli"),
              QStringLiteral("runInventory"),
              QStringLiteral("inventory_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              inventory::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"config", config}}));

    SystemDataSource systemSource;
    TerminalInstallRunner terminalInstaller;
    TerminalAnswerSource terminalAnswers;

    const DataSource &source = m_environment.source ? *m_environment.source : systemSource;
    InstallRunner &installer =
        m_environment.installer ? *m_environment.installer : terminalInstaller;
    AnswerSource &answers = m_environment.answers ? *m_environment.answers : terminalAnswers;

    const PlatformProfile profile =
        m_environment.profile.has_value() ? *m_environment.profile : resolvePlatform();

    // Dependency phase: every prompt happens before any section is collected.
    const PackageManager manager = detectPackageManager(source);
    DependencyResolver resolver(profile.family, manager, source, installer, answers,
                                source.isPrivileged(), std::cerr);
    const auto decisions = resolver.resolveAll(requiredTools(profile, config),
                                               config.allowInstall);

    size_t missing = 0;
    for (const auto &decision : decisions) {
        if (!decision.present) {
            ++missing;
        }
    }
    ILOG_INFO(QStringLiteral("InventoryCli"),
              QStringLiteral("runInventory"),
              QStringLiteral("dependencies_resolved"),
              QStringLiteral("pre_collection_phase"),
              QStringLiteral("dependency_resolver"),
              inventory::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"manager", manager},
                              {"tools", decisions.size()},
                              {"missing", missing}}));

    const ReportAssembler assembler(profile, config, source);
    QString path;
    const bool written = assembler.persist(enabledSections(profile, config),
                                           m_environment.outputDirectory,
                                           QDateTime::currentDateTime(),
                                           std::cout,
                                           &path);
    if (!written) {
        // The report was still streamed; a file problem is not fatal.
        std::cerr << "Warning: report could not be saved to " << path.toStdString()
                  << "; only the terminal copy is complete." << std::endl;
        return 0;
    }

    m_lastReportPath = path;
    std::cout << "\nReport stored in " << path.toStdString() << std::endl;
    return 0;
}

} // namespace inventory
