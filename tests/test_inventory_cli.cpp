#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

#include <iostream>
#include <sstream>

#include "core/platform_profile.hpp"
#include "report/InventoryCli.hpp"
#include "fake_host.hpp"

class InventoryCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testParseArguments();
    void testUnknownFlagWritesNothing();
    void testHelpWritesNothing();
    void testSkipInstallWithoutGpuAndNetwork();
    void testDeclinedInstallStillReports();
    void testUnwritableDirectoryIsNotFatal();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    int runCli(inventory::InventoryCli &cli, const QStringList &args,
               std::string &out, std::string &err);
    static QStringList reportFiles(const QString &directory);
};

void InventoryCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void InventoryCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

int InventoryCliTests::runCli(inventory::InventoryCli &cli, const QStringList &args,
                              std::string &out, std::string &err)
{
    std::stringstream outBuffer;
    std::stringstream errBuffer;
    auto *oldBuf = std::cout.rdbuf(outBuffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(errBuffer.rdbuf());

    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = outBuffer.str();
    err = errBuffer.str();
    return result;
}

QStringList InventoryCliTests::reportFiles(const QString &directory)
{
    return QDir(directory).entryList({QStringLiteral("collect_inventory_*.txt")}, QDir::Files);
}

void InventoryCliTests::testParseArguments()
{
    const auto defaults = inventory::parseArguments({QStringLiteral("collect_inventory")});
    QVERIFY(defaults.outcome == inventory::ParseOutcome::Run);
    QVERIFY(defaults.config.includeGpu);
    QVERIFY(defaults.config.includeNetwork);
    QVERIFY(defaults.config.allowInstall);

    const auto toggled = inventory::parseArguments({QStringLiteral("collect_inventory"),
                                                    QStringLiteral("--no-gpu"),
                                                    QStringLiteral("--skip-install"),
                                                    QStringLiteral("--no-network")});
    QVERIFY(toggled.outcome == inventory::ParseOutcome::Run);
    QVERIFY(!toggled.config.includeGpu);
    QVERIFY(!toggled.config.includeNetwork);
    QVERIFY(!toggled.config.allowInstall);

    const auto help = inventory::parseArguments({QStringLiteral("collect_inventory"),
                                                 QStringLiteral("--no-gpu"),
                                                 QStringLiteral("--help")});
    QVERIFY(help.outcome == inventory::ParseOutcome::Help);

    const auto invalid = inventory::parseArguments({QStringLiteral("collect_inventory"),
                                                    QStringLiteral("--verbose")});
    QVERIFY(invalid.outcome == inventory::ParseOutcome::Invalid);
    QCOMPARE(invalid.invalidArgument, QStringLiteral("--verbose"));
}

void InventoryCliTests::testUnknownFlagWritesNothing()
{
    QTemporaryDir outDir;
    QVERIFY(outDir.isValid());
    FakeHost host;
    RecordingInstaller installer;
    ScriptedAnswers answers;

    inventory::CliEnvironment environment;
    environment.source = &host;
    environment.installer = &installer;
    environment.answers = &answers;
    environment.profile = inventory::profileForKernelType("linux");
    environment.outputDirectory = outDir.path();
    inventory::InventoryCli cli(environment);

    std::string out;
    std::string err;
    const int code = runCli(cli, {QStringLiteral("collect_inventory"),
                                  QStringLiteral("--bogus")}, out, err);
    QCOMPARE(code, 1);
    QVERIFY(out.empty());
    QVERIFY(err.find("Unknown option: --bogus") != std::string::npos);
    QVERIFY(err.find("Usage: collect_inventory") != std::string::npos);
    QVERIFY(reportFiles(outDir.path()).isEmpty());
    QVERIFY(host.invocations.empty());
    QVERIFY(cli.lastReportPath().isEmpty());
}

void InventoryCliTests::testHelpWritesNothing()
{
    QTemporaryDir outDir;
    QVERIFY(outDir.isValid());
    FakeHost host;

    inventory::CliEnvironment environment;
    environment.source = &host;
    environment.profile = inventory::profileForKernelType("linux");
    environment.outputDirectory = outDir.path();
    inventory::InventoryCli cli(environment);

    std::string out;
    std::string err;
    const int code = runCli(cli, {QStringLiteral("collect_inventory"),
                                  QStringLiteral("-h")}, out, err);
    QCOMPARE(code, 0);
    QVERIFY(out.find("Usage: collect_inventory [--no-network] [--no-gpu] [--skip-install]")
            != std::string::npos);
    QVERIFY(reportFiles(outDir.path()).isEmpty());
}

void InventoryCliTests::testSkipInstallWithoutGpuAndNetwork()
{
    QTemporaryDir outDir;
    QVERIFY(outDir.isValid());
    FakeHost host;
    host.tools = {"apt", "sudo"};
    host.command("hostname", "lab-01\n");
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("y")};

    inventory::CliEnvironment environment;
    environment.source = &host;
    environment.installer = &installer;
    environment.answers = &answers;
    environment.profile = inventory::profileForKernelType("linux");
    environment.outputDirectory = outDir.path();
    inventory::InventoryCli cli(environment);

    std::string out;
    std::string err;
    const int code = runCli(cli, {QStringLiteral("collect_inventory"),
                                  QStringLiteral("--skip-install"),
                                  QStringLiteral("--no-gpu"),
                                  QStringLiteral("--no-network")}, out, err);
    QCOMPARE(code, 0);
    QVERIFY(installer.commands.empty());
    QVERIFY(answers.questions.empty());
    QVERIFY(err.find("Warning: 'lsblk' unavailable; skip-install mode active.")
            != std::string::npos);
    QVERIFY(err.find("'lspci'") == std::string::npos);
    QVERIFY(err.find("'ip'") == std::string::npos);

    const QStringList files = reportFiles(outDir.path());
    QCOMPARE(files.size(), qsizetype(1));
    const QRegularExpression pattern(
        QStringLiteral("^collect_inventory_\\d{8}_\\d{6}\\.txt$"));
    QVERIFY(pattern.match(files.front()).hasMatch());
    QCOMPARE(QDir(outDir.path()).filePath(files.front()), cli.lastReportPath());

    QFile file(cli.lastReportPath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const std::string content = file.readAll().toStdString();

    const std::string trailer = "\nReport stored in " + cli.lastReportPath().toStdString() + "\n";
    QVERIFY(out.size() > trailer.size());
    QCOMPARE(QString::fromStdString(out.substr(out.size() - trailer.size())),
             QString::fromStdString(trailer));
    QVERIFY(out.substr(0, out.size() - trailer.size()) == content);

    int headers = 0;
    for (size_t pos = content.find("\n== "); pos != std::string::npos;
         pos = content.find("\n== ", pos + 1)) {
        ++headers;
    }
    QCOMPARE(headers, 5);
}

void InventoryCliTests::testDeclinedInstallStillReports()
{
    QTemporaryDir outDir;
    QVERIFY(outDir.isValid());
    FakeHost host;
    for (const auto &tool : inventory::profileForKernelType("linux").baseTools) {
        host.tools.insert(tool);
    }
    host.tools.insert("apt");
    host.tools.insert("ip");
    host.tools.insert("dmidecode");
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("n")};

    inventory::CliEnvironment environment;
    environment.source = &host;
    environment.installer = &installer;
    environment.answers = &answers;
    environment.profile = inventory::profileForKernelType("linux");
    environment.outputDirectory = outDir.path();
    inventory::InventoryCli cli(environment);

    std::string out;
    std::string err;
    const int code = runCli(cli, {QStringLiteral("collect_inventory")}, out, err);
    QCOMPARE(code, 0);
    QCOMPARE(answers.questions.size(), size_t(1));
    QVERIFY(installer.commands.empty());
    QVERIFY(err.find("Skipping installation of 'pciutils'. Some sections may be incomplete.")
            != std::string::npos);
    QVERIFY(out.find("== Graphics ==\n  lspci missing; install pciutils to detect GPUs.\n")
            != std::string::npos);
    QVERIFY(out.find("== Network Interfaces ==") != std::string::npos);
    QCOMPARE(reportFiles(outDir.path()).size(), qsizetype(1));
}

void InventoryCliTests::testUnwritableDirectoryIsNotFatal()
{
    FakeHost host;
    host.command("hostname", "lab-01\n");

    inventory::CliEnvironment environment;
    environment.source = &host;
    environment.profile = inventory::profileForKernelType("linux");
    environment.outputDirectory = m_tempDir.path() + QStringLiteral("/does/not/exist");
    inventory::InventoryCli cli(environment);

    std::string out;
    std::string err;
    const int code = runCli(cli, {QStringLiteral("collect_inventory"),
                                  QStringLiteral("--skip-install")}, out, err);
    QCOMPARE(code, 0);
    QVERIFY(cli.lastReportPath().isEmpty());
    QVERIFY(err.find("Failed to create report file") != std::string::npos);
    QVERIFY(err.find("Warning: report could not be saved") != std::string::npos);
    QVERIFY(out.rfind("# Inventory Snapshot - ", 0) == 0);
    QVERIFY(out.find("== Operating System ==\n  Hostname:          lab-01\n")
            != std::string::npos);
    QVERIFY(out.find("== Network Interfaces ==") != std::string::npos);
    QVERIFY(out.find("Report stored in") == std::string::npos);
    const std::string footer = "\n# End of report\n";
    QCOMPARE(QString::fromStdString(out.substr(out.size() - footer.size())),
             QString::fromStdString(footer));
}

QTEST_MAIN(InventoryCliTests)
#include "test_inventory_cli.moc"
