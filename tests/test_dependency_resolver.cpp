#include <QtTest/QtTest>

#include <sstream>

#include "core/dependency_resolver.hpp"
#include "fake_host.hpp"

using inventory::DependencyResolver;
using inventory::Elevation;
using inventory::InstallAction;
using inventory::PackageManager;
using inventory::PlatformFamily;

namespace {

using Argv = std::vector<std::string>;

// Makes the installed package's tools appear on the fake host.
void installProvides(RecordingInstaller &installer, FakeHost &host,
                     const std::map<std::string, std::string> &packageToTool)
{
    installer.onRun = [&host, packageToTool](const Argv &argv) {
        const auto it = packageToTool.find(argv.back());
        if (it != packageToTool.end()) {
            host.tools.insert(it->second);
        }
    };
}

} // namespace

class DependencyResolverTests : public QObject
{
    Q_OBJECT
private slots:
    void testDecideInstallAction();
    void testPresentToolNeverPrompts();
    void testSkipInstallNeverInstalls();
    void testAptRefreshRunsOnce();
    void testDeclinedInstall();
    void testEndOfInputSkips();
    void testNoPackageManager();
    void testFailedInstallReported();
    void testFreeBsdUsesDoas();
    void testRootNeedsNoWrapper();
    void testInstallCommands();
};

void DependencyResolverTests::testDecideInstallAction()
{
    QVERIFY(inventory::decideInstallAction(std::string("y"), PackageManager::Apt)
            == InstallAction::Install);
    QVERIFY(inventory::decideInstallAction(std::string("Y"), PackageManager::Apt)
            == InstallAction::Install);
    QVERIFY(inventory::decideInstallAction(std::string(" Yes \n"), PackageManager::Dnf)
            == InstallAction::Install);
    QVERIFY(inventory::decideInstallAction(std::string(""), PackageManager::Apt)
            == InstallAction::Skip);
    QVERIFY(inventory::decideInstallAction(std::string("no"), PackageManager::Apt)
            == InstallAction::Skip);
    QVERIFY(inventory::decideInstallAction(std::string("yep"), PackageManager::Apt)
            == InstallAction::Skip);
    QVERIFY(inventory::decideInstallAction(std::nullopt, PackageManager::Apt)
            == InstallAction::Skip);
    QVERIFY(inventory::decideInstallAction(std::string("y"), PackageManager::None)
            == InstallAction::Skip);
}

void DependencyResolverTests::testPresentToolNeverPrompts()
{
    FakeHost host;
    host.tools = {"apt", "lsblk"};
    RecordingInstaller installer;
    ScriptedAnswers answers;
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Apt, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("lsblk", true);

    QVERIFY(decision.present);
    QVERIFY(!decision.userChoseInstall);
    QVERIFY(answers.questions.empty());
    QVERIFY(installer.commands.empty());
    QVERIFY(err.str().empty());
}

void DependencyResolverTests::testSkipInstallNeverInstalls()
{
    FakeHost host;
    host.tools = {"apt"};
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("y"), std::string("y")};
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Apt, host, installer,
                                answers, false, err);
    const auto decisions = resolver.resolveAll({"lspci", "ip"}, false);

    QCOMPARE(decisions.size(), size_t(2));
    for (const auto &decision : decisions) {
        QVERIFY(!decision.present);
        QVERIFY(!decision.userChoseInstall);
    }
    QVERIFY(answers.questions.empty());
    QVERIFY(installer.commands.empty());
    QVERIFY(!resolver.indexRefreshed());
    QVERIFY(err.str().find("Warning: 'lspci' unavailable; skip-install mode active.")
            != std::string::npos);
    QVERIFY(err.str().find("is missing.") == std::string::npos);
}

void DependencyResolverTests::testAptRefreshRunsOnce()
{
    FakeHost host;
    host.tools = {"apt", "sudo"};
    RecordingInstaller installer;
    installProvides(installer, host,
                    {{"util-linux", "lsblk"}, {"pciutils", "lspci"}, {"iproute2", "ip"}});
    ScriptedAnswers answers;
    answers.answers = {std::string("y"), std::string("yes"), std::string("Y")};
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Apt, host, installer,
                                answers, false, err);
    const auto decisions = resolver.resolveAll({"lsblk", "lspci", "ip"}, true);

    const std::vector<Argv> expected = {
        {"sudo", "apt", "update"},
        {"sudo", "apt", "install", "-y", "util-linux"},
        {"sudo", "apt", "install", "-y", "pciutils"},
        {"sudo", "apt", "install", "-y", "iproute2"},
    };
    QVERIFY(installer.commands == expected);
    QVERIFY(resolver.indexRefreshed());
    QCOMPARE(answers.questions.size(), size_t(3));
    QCOMPARE(QString::fromStdString(answers.questions.front()),
             QStringLiteral("Install package 'util-linux' with apt to enable 'lsblk'? [y/N]: "));
    for (const auto &decision : decisions) {
        QVERIFY(decision.present);
        QVERIFY(decision.userChoseInstall);
        QVERIFY(decision.installSucceeded);
    }
}

void DependencyResolverTests::testDeclinedInstall()
{
    FakeHost host;
    host.tools = {"dnf"};
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("n")};
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Dnf, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("lspci", true);

    QVERIFY(!decision.present);
    QVERIFY(!decision.userChoseInstall);
    QVERIFY(installer.commands.empty());
    QVERIFY(err.str().find("Dependency 'lspci' is missing.") != std::string::npos);
    QVERIFY(err.str().find("Skipping installation of 'pciutils'. Some sections may be incomplete.")
            != std::string::npos);
}

void DependencyResolverTests::testEndOfInputSkips()
{
    FakeHost host;
    host.tools = {"apt"};
    RecordingInstaller installer;
    ScriptedAnswers answers;
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Apt, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("ip", true);

    QCOMPARE(answers.questions.size(), size_t(1));
    QVERIFY(!decision.userChoseInstall);
    QVERIFY(installer.commands.empty());
}

void DependencyResolverTests::testNoPackageManager()
{
    FakeHost host;
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("y")};
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::None, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("lsblk", true);

    QVERIFY(!decision.present);
    QVERIFY(answers.questions.empty());
    QVERIFY(installer.commands.empty());
    QVERIFY(err.str().find("Missing command 'lsblk'. Install package 'util-linux' manually and rerun.")
            != std::string::npos);
}

void DependencyResolverTests::testFailedInstallReported()
{
    FakeHost host;
    host.tools = {"pacman", "sudo"};
    RecordingInstaller installer;
    installer.exitCode = 1;
    ScriptedAnswers answers;
    answers.answers = {std::string("y")};
    std::ostringstream err;

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::Pacman, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("lspci", true);

    QVERIFY(decision.userChoseInstall);
    QVERIFY(!decision.installSucceeded);
    QVERIFY(!decision.present);
    QCOMPARE(installer.commands.size(), size_t(1));
    QVERIFY(!resolver.indexRefreshed());
    QVERIFY(err.str().find("  -> 'lspci' still unavailable after attempted install.")
            != std::string::npos);
}

void DependencyResolverTests::testFreeBsdUsesDoas()
{
    FakeHost host;
    host.tools = {"pkg", "doas"};
    RecordingInstaller installer;
    installProvides(installer, host, {{"dmidecode", "dmidecode"}});
    ScriptedAnswers answers;
    answers.answers = {std::string("y")};
    std::ostringstream err;

    QVERIFY(inventory::selectElevation(PlatformFamily::FreeBSD, host, false) == Elevation::Doas);
    host.tools.insert("sudo");
    QVERIFY(inventory::selectElevation(PlatformFamily::FreeBSD, host, false) == Elevation::Sudo);
    host.tools.erase("sudo");

    DependencyResolver resolver(PlatformFamily::FreeBSD, PackageManager::Pkg, host, installer,
                                answers, false, err);
    const auto decision = resolver.ensure("dmidecode", true);

    const std::vector<Argv> expected = {{"doas", "pkg", "install", "-y", "dmidecode"}};
    QVERIFY(installer.commands == expected);
    QVERIFY(decision.installSucceeded);
}

void DependencyResolverTests::testRootNeedsNoWrapper()
{
    FakeHost host;
    host.tools = {"apt-get", "sudo"};
    RecordingInstaller installer;
    ScriptedAnswers answers;
    answers.answers = {std::string("y")};
    std::ostringstream err;

    QVERIFY(inventory::selectElevation(PlatformFamily::Linux, host, true) == Elevation::None);

    DependencyResolver resolver(PlatformFamily::Linux, PackageManager::AptGet, host, installer,
                                answers, true, err);
    resolver.ensure("lsblk", true);

    const std::vector<Argv> expected = {
        {"apt-get", "update"},
        {"apt-get", "install", "-y", "util-linux"},
    };
    QVERIFY(installer.commands == expected);
}

void DependencyResolverTests::testInstallCommands()
{
    QVERIFY(inventory::installCommand(PackageManager::Pacman, "pciutils", Elevation::Sudo)
            == (Argv{"sudo", "pacman", "-Sy", "--noconfirm", "pciutils"}));
    QVERIFY(inventory::installCommand(PackageManager::Zypper, "iproute2", Elevation::Sudo)
            == (Argv{"sudo", "zypper", "--non-interactive", "install", "iproute2"}));
    QVERIFY(inventory::installCommand(PackageManager::Yum, "pciutils", Elevation::None)
            == (Argv{"yum", "install", "-y", "pciutils"}));
    QVERIFY(inventory::installCommand(PackageManager::None, "pciutils", Elevation::Sudo).empty());

    QVERIFY(inventory::indexRefreshCommand(PackageManager::Dnf, Elevation::Sudo).empty());
    QVERIFY(inventory::indexRefreshCommand(PackageManager::Apt, Elevation::Sudo)
            == (Argv{"sudo", "apt", "update"}));
}

QTEST_MAIN(DependencyResolverTests)
#include "test_dependency_resolver.moc"
