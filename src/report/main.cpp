#include <QCoreApplication>

#include "report/InventoryCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("collect-inventory"));

    bool trace = qEnvironmentVariableIntValue("INVENTORY_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    inventory::logging::initLogging(QStringLiteral("collect-inventory"), trace);
    ILOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("inventory_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              inventory::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", argc - 1}}));

    // Single synchronous run; the Qt event loop is never entered.
    inventory::InventoryCli cli;
    return cli.run(argc, argv);
}
