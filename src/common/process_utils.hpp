#pragma once

#include <QString>
#include <QStringList>

namespace inventory {

struct CommandResult {
    bool started = false;
    int exitCode = -1;
    QString output;

    bool succeeded() const { return started && exitCode == 0; }
};

// Runs a program with captured stdout. Stderr is discarded.
CommandResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs = 30000);

// Runs a program attached to the invoking terminal (password prompts,
// package-manager progress). Returns the exit code or -1 if it never ran.
int runForwarded(const QString &program, const QStringList &arguments);

bool isExecutableOnPath(const QString &name);

bool isPrivileged();

} // namespace inventory
