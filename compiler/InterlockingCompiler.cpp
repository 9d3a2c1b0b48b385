#include "InterlockingCompiler.h"
#include "TopologySeeder.h"
#include "../database/DatabaseInitializer.h"
#include "../database/DatabaseManager.h"
#include "../signal/SignalVisibilityExpander.h"
#include "../table/CsvReader.h"
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>

namespace RailSeed {

InterlockingCompiler::InterlockingCompiler(const CompilerConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
}

InterlockingCompiler::~InterlockingCompiler() = default;

void InterlockingCompiler::setServices(DatabaseManager* dbManager) {
    m_dbManager = dbManager;
}

CompileRunResult InterlockingCompiler::run() {
    QElapsedTimer timer;
    timer.start();

    m_registry = InterlockingRegistry();
    m_topology.reset();
    m_stations.clear();
    m_statistics.clear();

    CompileRunResult runResult;
    CompileResult result;

    emit progressChanged(5, "Preparing database");
    result = prepareDatabase();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(15, "Seeding topology");
    result = seedTopology();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(30, "Seeding station objects");
    result = seedStationObjects();
    if (!result.isOk()) return fail(runResult, result);

    // Lever -> route and cross-station lookups need every station's objects
    m_registry.freezeObjects();
    for (const auto& station : m_stations) {
        runResult.stationIds.append(station->stationId());
    }

    emit progressChanged(50, "Compiling locks");
    result = compileStationLocks();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(65, "Seeding operation notification displays");
    result = seedOperationNotificationDisplays();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(70, "Seeding route lock track circuits");
    result = seedRouteLockTrackCircuits();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(75, "Seeding post associations");
    result = seedPostAssociations();
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(85, "Expanding next signals");
    SignalVisibilityExpander expander(m_registry);
    m_statistics["expandedNextSignals"] = expander.expand();

    emit progressChanged(90, "Committing");
    result = commit(runResult);
    if (!result.isOk()) return fail(runResult, result);

    emit progressChanged(100, "Completed");

    m_statistics["elapsedMs"] = timer.elapsed();
    runResult.success = true;
    runResult.result = CompileResult::ok();
    runResult.statistics = m_statistics;
    qDebug() << " [InterlockingCompiler] Compilation completed:" << runResult.stationIds.size() << "stations,"
             << runResult.committedRows << "rows committed in" << timer.elapsed() << "ms";
    return runResult;
}

CompileResult InterlockingCompiler::prepareDatabase() {
    if (!m_dbManager) {
        qDebug() << " [InterlockingCompiler] Dry run: registry starts empty and nothing is committed";
        return CompileResult::ok();
    }

    if (!m_dbManager->isConnected()) {
        return CompileResult::missingUpstreamData("Database is not connected");
    }

    DatabaseInitializer initializer(m_dbManager->getDatabase());
    if (!initializer.initializeSchema()) {
        return CompileResult::missingUpstreamData(
            QString("Schema initialization failed: %1").arg(initializer.lastError()));
    }

    if (!m_dbManager->loadRegistry(m_registry)) {
        return CompileResult::missingUpstreamData(
            QString("Loading existing rows failed: %1").arg(m_dbManager->lastError()));
    }
    return CompileResult::ok();
}

CompileResult InterlockingCompiler::seedTopology() {
    m_topology = std::make_unique<Table::TopologyDocument>();
    if (!m_topology->loadFromFile(m_config.topologyFilePath())) {
        return CompileResult::missingUpstreamData(m_topology->lastError())
            .setToken(m_config.topologyFilePath());
    }

    TopologySeeder seeder(m_registry, *m_topology);
    CompileResult result = seeder.seed();
    mergeStatistics("topology", seeder.statistics());
    return result;
}

CompileResult InterlockingCompiler::seedStationObjects() {
    QDir directory(m_config.rendoTableDirectory());
    if (!directory.exists()) {
        qWarning() << " [InterlockingCompiler] No station table directory at" << directory.path();
        return CompileResult::ok();
    }

    const QFileInfoList files = directory.entryInfoList({"*.csv"}, QDir::Files, QDir::Name);
    for (const QFileInfo& file : files) {
        const QString stationId = file.completeBaseName();

        Table::CsvReader reader;
        if (!reader.readFile(file.absoluteFilePath())) {
            return CompileResult::missingUpstreamData(reader.lastError()).setStationId(stationId);
        }

        auto station = std::make_unique<StationTableCompiler>(
            stationId, reader.toRendoTable(), m_registry, m_config);
        CompileResult result = station->compileObjects();
        if (!result.isOk()) {
            return result;
        }
        mergeStatistics(stationId, station->statistics());
        m_stations.push_back(std::move(station));
    }

    qDebug() << " [InterlockingCompiler] Seeded objects of" << m_stations.size() << "stations";
    return CompileResult::ok();
}

CompileResult InterlockingCompiler::compileStationLocks() {
    for (const auto& station : m_stations) {
        CompileResult result = station->compileLocks();
        if (!result.isOk()) {
            return result;
        }
        mergeStatistics(station->stationId(), station->statistics());
        emit stationCompiled(station->stationId());
    }
    return CompileResult::ok();
}

// Columns: display name, station id, up, down, then the track circuits it covers
CompileResult InterlockingCompiler::seedOperationNotificationDisplays() {
    const QString path = m_config.operationNotificationDisplayFilePath();
    if (!QFileInfo::exists(path)) {
        qDebug() << " [InterlockingCompiler] No operation notification display table at" << path;
        return CompileResult::ok();
    }

    Table::CsvReader reader;
    if (!reader.readFile(path)) {
        return CompileResult::missingUpstreamData(reader.lastError()).setToken(path);
    }

    int added = 0;
    int linked = 0;
    for (const QStringList& record : reader.records()) {
        if (record.isEmpty() || record.first().trimmed().isEmpty()) continue;

        OperationNotificationDisplay display;
        display.name = record.first().trimmed();
        if (m_registry.containsOperationNotificationDisplay(display.name)) {
            continue;
        }
        if (record.size() < 4) {
            return CompileResult::missingUpstreamData(
                QString("Operation notification display %1 needs station, up and down columns").arg(display.name))
                .setToken(display.name);
        }

        display.stationId = record.at(1).trimmed();
        std::optional<bool> isUp = Table::CsvReader::parseBool(record.at(2));
        std::optional<bool> isDown = Table::CsvReader::parseBool(record.at(3));
        if (!isUp || !isDown) {
            return CompileResult::missingUpstreamData(
                QString("Operation notification display %1 has an invalid direction flag").arg(display.name))
                .setStationId(display.stationId)
                .setToken(display.name);
        }
        display.isUp = *isUp;
        display.isDown = *isDown;

        m_registry.addOperationNotificationDisplay(display);
        ++added;

        for (int i = 4; i < record.size(); ++i) {
            const QString trackCircuitName = record.at(i).trimmed();
            if (trackCircuitName.isEmpty()) continue;

            const InterlockingObject* trackCircuit = m_registry.findObject(trackCircuitName);
            if (!trackCircuit || !trackCircuit->isTrackCircuit()) {
                qDebug() << " [InterlockingCompiler] Display" << display.name
                         << "lists unknown track circuit" << trackCircuitName;
                continue;
            }
            if (m_registry.updateOperationNotificationDisplayName(trackCircuit->id, display.name)) {
                ++linked;
            }
        }
    }

    m_statistics["operationNotificationDisplays"] = added;
    m_statistics["operationNotificationTrackCircuits"] = linked;
    return CompileResult::ok();
}

CompileResult InterlockingCompiler::seedRouteLockTrackCircuits() {
    const QString path = m_config.routeTrackCircuitFilePath();
    if (!QFileInfo::exists(path)) {
        qDebug() << " [InterlockingCompiler] No route track circuit table at" << path;
        return CompileResult::ok();
    }

    Table::CsvReader reader;
    if (!reader.readFile(path)) {
        return CompileResult::missingUpstreamData(reader.lastError()).setToken(path);
    }

    int added = 0;
    for (const QStringList& record : reader.records()) {
        if (record.isEmpty()) continue;

        const InterlockingObject* route = m_registry.findObject(record.first().trimmed());
        if (!route || !route->isRoute()) {
            continue;
        }
        const qulonglong routeId = route->id;

        for (int i = 1; i < record.size(); ++i) {
            const QString trackCircuitName = record.at(i).trimmed();
            if (trackCircuitName.isEmpty()) continue;

            const InterlockingObject* trackCircuit = m_registry.findObject(trackCircuitName);
            if (!trackCircuit || !trackCircuit->isTrackCircuit()) {
                continue;
            }

            RouteLockTrackCircuit association;
            association.routeId = routeId;
            association.trackCircuitId = trackCircuit->id;
            if (m_registry.addRouteLockTrackCircuit(association)) {
                ++added;
            }
        }
    }

    m_statistics["routeLockTrackCircuits"] = added;
    return CompileResult::ok();
}

CompileResult InterlockingCompiler::seedPostAssociations() {
    TopologySeeder seeder(m_registry, *m_topology);
    CompileResult result = seeder.seedPostAssociations();
    mergeStatistics("post", seeder.statistics());
    return result;
}

CompileResult InterlockingCompiler::commit(CompileRunResult& runResult) {
    const int pending = m_registry.pendingRowCount();
    m_statistics["pendingRows"] = pending;

    if (!m_dbManager) {
        qDebug() << " [InterlockingCompiler] Dry run:" << pending << "rows not committed";
        return CompileResult::ok();
    }

    if (!m_dbManager->commitRegistry(m_registry)) {
        return CompileResult::missingUpstreamData(
            QString("Commit failed: %1").arg(m_dbManager->lastError()));
    }
    runResult.committedRows = pending;
    return CompileResult::ok();
}

CompileRunResult InterlockingCompiler::fail(CompileRunResult runResult, const CompileResult& result) {
    qCritical() << " [InterlockingCompiler] Compilation aborted:" << result.describe();
    emit compilationFailed(result.describe());

    m_statistics["failure"] = result.toVariantMap();
    runResult.success = false;
    runResult.result = result;
    runResult.statistics = m_statistics;
    return runResult;
}

void InterlockingCompiler::mergeStatistics(const QString& prefix, const QVariantMap& statistics) {
    for (auto it = statistics.constBegin(); it != statistics.constEnd(); ++it) {
        m_statistics[prefix + "." + it.key()] = it.value();
    }
}

} // namespace RailSeed
