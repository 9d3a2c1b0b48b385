#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <memory>
#include <vector>
#include "CompileResult.h"
#include "StationTableCompiler.h"
#include "../config/CompilerConfig.h"
#include "../model/InterlockingRegistry.h"
#include "../table/TopologyDocument.h"

namespace RailSeed {

class DatabaseManager;

struct CompileRunResult {
    bool success = false;
    CompileResult result;
    int committedRows = 0;
    QStringList stationIds;
    QVariantMap statistics;
};

// Runs a whole compilation: registry load, topology, every station table,
// operation notification displays, route lock track circuits, post
// associations, next-signal expansion and one commit. Without a database
// manager the run stops before the commit (dry run).
class InterlockingCompiler : public QObject {
    Q_OBJECT

public:
    explicit InterlockingCompiler(const CompilerConfig& config, QObject* parent = nullptr);
    ~InterlockingCompiler();

    // Service composition - call before run(); nullptr means dry run
    void setServices(DatabaseManager* dbManager);

    CompileRunResult run();

    const InterlockingRegistry& registry() const { return m_registry; }

signals:
    void progressChanged(int percent, const QString& operation);
    void stationCompiled(const QString& stationId);
    void compilationFailed(const QString& description);

private:
    CompileResult prepareDatabase();
    CompileResult seedTopology();
    CompileResult seedStationObjects();
    CompileResult compileStationLocks();
    CompileResult seedOperationNotificationDisplays();
    CompileResult seedRouteLockTrackCircuits();
    CompileResult seedPostAssociations();
    CompileResult commit(CompileRunResult& runResult);

    CompileRunResult fail(CompileRunResult runResult, const CompileResult& result);
    void mergeStatistics(const QString& prefix, const QVariantMap& statistics);

    const CompilerConfig& m_config;
    DatabaseManager* m_dbManager = nullptr;

    InterlockingRegistry m_registry;
    std::unique_ptr<Table::TopologyDocument> m_topology;
    std::vector<std::unique_ptr<StationTableCompiler>> m_stations;
    QVariantMap m_statistics;
};

} // namespace RailSeed
