#include "common/process_utils.hpp"

#include <QProcess>
#include <QStandardPaths>

#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace inventory {

CommandResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.setStandardErrorFile(QProcess::nullDevice());
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        ILOG_DEBUG(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runCommand"),
                   QStringLiteral("command_not_started"),
                   QStringLiteral("missing_or_not_executable"),
                   QStringLiteral("qprocess"),
                   inventory::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", program.toStdString()}}));
        return result;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        ILOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runCommand"),
                  QStringLiteral("command_timeout"),
                  QStringLiteral("no_exit_within_budget"),
                  QStringLiteral("qprocess_kill"),
                  inventory::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", program.toStdString()},
                                  {"timeoutMs", timeoutMs}}));
        return result;
    }

    result.started = true;
    if (process.exitStatus() != QProcess::NormalExit) {
        return result;
    }

    result.exitCode = process.exitCode();
    result.output = QString::fromUtf8(process.readAllStandardOutput());
    return result;
}

int runForwarded(const QString &program, const QStringList &arguments)
{
    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        return -1;
    }

    // Installs can take arbitrarily long; wait without a deadline.
    if (!process.waitForFinished(-1)) {
        return -1;
    }
    if (process.exitStatus() != QProcess::NormalExit) {
        return -1;
    }
    return process.exitCode();
}

bool isExecutableOnPath(const QString &name)
{
    if (name.isEmpty()) {
        return false;
    }
    return !QStandardPaths::findExecutable(name).isEmpty();
}

bool isPrivileged()
{
    return geteuid() == 0;
}

} // namespace inventory
