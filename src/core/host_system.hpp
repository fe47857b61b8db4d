#pragma once

#include <optional>
#include <string>
#include <vector>

namespace inventory {

/**
 * Answers "is this executable on the search path?".
 * Implementations must be side-effect free; no caching is expected.
 */
class ToolAvailability
{
public:
    virtual ~ToolAvailability() = default;
    virtual bool exists(const std::string &tool) const = 0;
};

/**
 * Read-only view of the host used by section collectors.
 * run() yields stdout only when the program started and exited 0;
 * readFile() yields the contents only when the file is readable.
 */
class DataSource : public ToolAvailability
{
public:
    virtual std::optional<std::string> run(const std::string &program,
                                           const std::vector<std::string> &args) const = 0;
    virtual std::optional<std::string> readFile(const std::string &path) const = 0;
    virtual bool isPrivileged() const = 0;
};

class SystemDataSource : public DataSource
{
public:
    bool exists(const std::string &tool) const override;
    std::optional<std::string> run(const std::string &program,
                                   const std::vector<std::string> &args) const override;
    std::optional<std::string> readFile(const std::string &path) const override;
    bool isPrivileged() const override;
};

// Executes an install-phase command line (argv[0] is the program).
class InstallRunner
{
public:
    virtual ~InstallRunner() = default;
    virtual int run(const std::vector<std::string> &argv) = 0;
};

class TerminalInstallRunner : public InstallRunner
{
public:
    int run(const std::vector<std::string> &argv) override;
};

// Obtains a line of user input; std::nullopt on end of input.
class AnswerSource
{
public:
    virtual ~AnswerSource() = default;
    virtual std::optional<std::string> ask(const std::string &question) = 0;
};

class TerminalAnswerSource : public AnswerSource
{
public:
    std::optional<std::string> ask(const std::string &question) override;
};

} // namespace inventory
