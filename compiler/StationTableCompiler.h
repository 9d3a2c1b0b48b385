#pragma once
#include <QString>
#include <QVariantMap>
#include <optional>
#include "CompileResult.h"
#include "../config/CompilerConfig.h"
#include "../lock/LockExpressionParser.h"
#include "../lock/LockGraphMaterializer.h"
#include "../model/InterlockingRegistry.h"
#include "../table/RendoTableRow.h"

namespace RailSeed {

// Compiles one station's interlocking table in two phases. compileObjects()
// seeds levers, switching machines, destination buttons and routes;
// compileLocks() runs after every station's objects are frozen and turns the
// lock columns into lock graphs.
class StationTableCompiler {
public:
    StationTableCompiler(const QString& stationId, const Table::RendoTable& rows,
                         InterlockingRegistry& registry, const CompilerConfig& config);

    QString stationId() const { return m_stationId; }
    const Table::RendoTable& rows() const { return m_rows; }

    CompileResult compileObjects();
    CompileResult compileLocks();

    QVariantMap statistics() const { return m_statistics; }

    // "場内" -> Arriving, ...; none for rows that set up no route
    static std::optional<RouteType> routeTypeForRow(const QString& name);
    static bool isSwitchingMachineRow(const QString& name);

    // Drops trailing ((...)) total-control groups from a signal control column
    static QString stripTotalControl(const QString& signalControl);

private:
    // === OBJECTS PHASE ===
    void seedLevers();
    void seedDestinationButtons();
    void seedRoutes();

    // === LOCK PHASE ===
    CompileResult compileRouteLocks(const Table::RendoTableRow& row, const InterlockingObject& route,
                                    Locking::LockGraphMaterializer& materializer);
    CompileResult compileDetectorLocks(Locking::LockGraphMaterializer& materializer);
    CompileResult compileColumn(const QString& expression, Locking::ParseMode mode,
                                const Locking::MaterializeRequest& request,
                                Locking::LockGraphMaterializer& materializer);

    CompileResult withContext(CompileResult result, const Table::RendoTableRow& row) const;
    void count(const QString& key, int added);

    QString m_stationId;
    Table::RendoTable m_rows;
    InterlockingRegistry& m_registry;
    const CompilerConfig& m_config;
    Locking::LockExpressionParser m_parser;
    QVariantMap m_statistics;
};

} // namespace RailSeed
