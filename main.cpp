#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDebug>
#include "config/CompilerConfig.h"
#include "compiler/InterlockingCompiler.h"
#include "database/DatabaseManager.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("railseed");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Compiles station interlocking tables and topology data into the interlocking database");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"c", "config"}, "JSON configuration file.", "file");
    QCommandLineOption dataDirOption({"d", "data-dir"}, "Directory holding DBBase.json and RendoTable/.", "directory");
    QCommandLineOption driverOption("driver", "Qt SQL driver (QPSQL or QSQLITE).", "driver");
    QCommandLineOption databaseOption("database", "Database name, or file path for QSQLITE.", "name");
    QCommandLineOption dryRunOption("dry-run", "Compile without reading or writing a database.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print debug output.");
    parser.addOptions({configOption, dataDirOption, driverOption, databaseOption, dryRunOption, verboseOption});
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    RailSeed::CompilerConfig config;
    if (parser.isSet(configOption) && !config.loadFromFile(parser.value(configOption))) {
        qCritical() << "Configuration error:" << config.lastError();
        return 2;
    }

    // Command line values override the configuration file
    if (parser.isSet(dataDirOption)) {
        config.setDataDirectory(parser.value(dataDirOption));
    }
    if (parser.isSet(driverOption)) {
        config.database().driver = parser.value(driverOption);
    }
    if (parser.isSet(databaseOption)) {
        config.database().databaseName = parser.value(databaseOption);
    }

    RailSeed::DatabaseManager dbManager;
    RailSeed::InterlockingCompiler compiler(config);

    QObject::connect(&dbManager, &RailSeed::DatabaseManager::errorOccurred,
                     [](const QString& error) {
                         qWarning() << "Database error:" << error;
                     });

    QObject::connect(&compiler, &RailSeed::InterlockingCompiler::progressChanged,
                     [](int percent, const QString& operation) {
                         qDebug() << QString("[%1%]").arg(percent, 3) << operation;
                     });

    QObject::connect(&compiler, &RailSeed::InterlockingCompiler::stationCompiled,
                     [](const QString& stationId) {
                         qDebug() << "Station compiled:" << stationId;
                     });

    if (!parser.isSet(dryRunOption)) {
        qDebug() << "Connecting to database...";
        if (!dbManager.connectToDatabase(config.database())) {
            qCritical() << "Failed to connect to database:" << dbManager.lastError();
            return 3;
        }
        compiler.setServices(&dbManager);
    }

    RailSeed::CompileRunResult runResult = compiler.run();
    dbManager.cleanup();

    if (!runResult.success) {
        qCritical().noquote() << "Compilation failed:" << runResult.result.describe();
        return 1;
    }

    qInfo().noquote() << QString("Compiled %1 stations, %2 rows committed%3")
                             .arg(runResult.stationIds.size())
                             .arg(runResult.committedRows)
                             .arg(parser.isSet(dryRunOption) ? " (dry run)" : "");
    return 0;
}
