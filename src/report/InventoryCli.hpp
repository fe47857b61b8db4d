#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "core/host_system.hpp"

namespace inventory {

enum class ParseOutcome {
    Run,
    Help,
    Invalid
};

struct ParsedArguments {
    ParseOutcome outcome = ParseOutcome::Run;
    RunConfig config;
    QString invalidArgument;
};

// args[0] is the program name.
ParsedArguments parseArguments(const QStringList &args);

QString usageText();

// Host collaborators; anything left unset falls back to the real system.
struct CliEnvironment {
    const DataSource *source = nullptr;
    InstallRunner *installer = nullptr;
    AnswerSource *answers = nullptr;
    std::optional<PlatformProfile> profile;
    QString outputDirectory;
};

class InventoryCli
{
public:
    InventoryCli();
    explicit InventoryCli(CliEnvironment environment);

    // Parses flags, resolves dependencies, then writes the report.
    // returns exit code
    int run(int argc, char *argv[]);

    // Empty until a report file has been written.
    QString lastReportPath() const { return m_lastReportPath; }

private:
    int runInventory(const RunConfig &config);

    CliEnvironment m_environment;
    QString m_lastReportPath;
};

} // namespace inventory
