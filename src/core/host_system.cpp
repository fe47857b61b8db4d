#include "core/host_system.hpp"

#include <iostream>

#include <QFile>
#include <QStringList>

#include "common/process_utils.hpp"

namespace inventory {

namespace {

QStringList toQStringList(const std::vector<std::string> &values)
{
    QStringList out;
    out.reserve(static_cast<int>(values.size()));
    for (const auto &value : values) {
        out.push_back(QString::fromStdString(value));
    }
    return out;
}

} // namespace

bool SystemDataSource::exists(const std::string &tool) const
{
    return isExecutableOnPath(QString::fromStdString(tool));
}

std::optional<std::string> SystemDataSource::run(
    const std::string &program, const std::vector<std::string> &args) const
{
    const CommandResult result =
        runCommand(QString::fromStdString(program), toQStringList(args));
    if (!result.succeeded()) {
        return std::nullopt;
    }
    return result.output.toStdString();
}

std::optional<std::string> SystemDataSource::readFile(const std::string &path) const
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

bool SystemDataSource::isPrivileged() const
{
    return inventory::isPrivileged();
}

int TerminalInstallRunner::run(const std::vector<std::string> &argv)
{
    if (argv.empty()) {
        return -1;
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    // Flush so our own prompts appear before the child's output.
    std::cout.flush();
    std::cerr.flush();
    return runForwarded(QString::fromStdString(argv.front()), toQStringList(args));
}

std::optional<std::string> TerminalAnswerSource::ask(const std::string &question)
{
    std::cerr << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cerr << std::endl;
        return std::nullopt;
    }
    return line;
}

} // namespace inventory
