#include "StationTableCompiler.h"
#include "../lock/NameResolver.h"
#include "../model/ObjectNames.h"
#include "../table/RowPreprocessor.h"
#include <QDebug>
#include <QRegularExpression>

namespace RailSeed {

using Table::RendoTableRow;

namespace {

const QString SuffixSignalLever = QStringLiteral("信号機");
const QString PrefixSwitchingMachine = QStringLiteral("転てつ器");

} // namespace

StationTableCompiler::StationTableCompiler(const QString& stationId, const Table::RendoTable& rows,
                                           InterlockingRegistry& registry, const CompilerConfig& config)
    : m_stationId(stationId)
    , m_rows(rows)
    , m_registry(registry)
    , m_config(config)
    , m_parser(stationId, config.adjacentStations(stationId))
{
    Table::RowPreprocessor::normalize(m_rows);
}

std::optional<RouteType> StationTableCompiler::routeTypeForRow(const QString& name) {
    if (name.contains(QStringLiteral("場内"))) return RouteType::Arriving;
    if (name.contains(QStringLiteral("出発"))) return RouteType::Departure;
    if (name.contains(QStringLiteral("誘導"))) return RouteType::Guide;
    if (name.contains(QStringLiteral("入換信号"))) return RouteType::SwitchSignal;
    if (name.contains(QStringLiteral("入換標識"))) return RouteType::SwitchRoute;
    return std::nullopt;
}

bool StationTableCompiler::isSwitchingMachineRow(const QString& name) {
    return name.startsWith(PrefixSwitchingMachine);
}

QString StationTableCompiler::stripTotalControl(const QString& signalControl) {
    static const QRegularExpression pattern(
        QStringLiteral(R"(^(.*?)(?:\(\(([^\)\s]+)\)\)\s*)*$)"),
        QRegularExpression::DotMatchesEverythingOption);
    QRegularExpressionMatch match = pattern.match(signalControl);
    return match.hasMatch() ? match.captured(1) : signalControl;
}

void StationTableCompiler::count(const QString& key, int added) {
    m_statistics[key] = m_statistics.value(key).toInt() + added;
}

CompileResult StationTableCompiler::withContext(CompileResult result, const RendoTableRow& row) const {
    result.setStationId(m_stationId).setLeverName(row.start);
    return result;
}

// === OBJECTS PHASE ===

CompileResult StationTableCompiler::compileObjects() {
    if (m_registry.isFrozen()) {
        return CompileResult::missingUpstreamData("Station objects seeded after the registry was frozen")
            .setStationId(m_stationId);
    }

    seedLevers();
    seedDestinationButtons();
    seedRoutes();

    qDebug() << " [StationTableCompiler]" << m_stationId << "objects:" << m_statistics;
    return CompileResult::ok();
}

void StationTableCompiler::seedLevers() {
    int added = 0;
    for (const RendoTableRow& row : m_rows) {
        LeverType leverType;
        if (row.name.endsWith(SuffixSignalLever)) {
            leverType = LeverType::Route;
        } else if (isSwitchingMachineRow(row.name)) {
            leverType = LeverType::SwitchingMachine;
        } else {
            continue;
        }

        const QString leverName = ObjectNames::leverName(m_stationId, row.start);
        if (row.start.isEmpty() || m_registry.containsObject(leverName)) {
            continue;
        }

        InterlockingObject lever;
        lever.type = ObjectType::Lever;
        lever.name = leverName;
        lever.leverType = leverType;

        // A switching machine lever owns the machine it throws
        if (leverType == LeverType::SwitchingMachine) {
            InterlockingObject switchingMachine;
            switchingMachine.type = ObjectType::SwitchingMachine;
            switchingMachine.name = ObjectNames::switchingMachineName(m_stationId, row.start);
            lever.switchingMachineId = m_registry.addObject(switchingMachine);
        }

        if (m_registry.addObject(lever) != 0) {
            ++added;
        }
    }
    count("levers", added);
}

void StationTableCompiler::seedDestinationButtons() {
    int added = 0;
    for (const RendoTableRow& row : m_rows) {
        if (row.end.trimmed().isEmpty() || row.end == "L" || row.end == "R") {
            continue;
        }

        const QString buttonName = ObjectNames::destinationButtonName(m_stationId, row.end);
        if (m_registry.containsObject(buttonName)) {
            continue;
        }

        InterlockingObject button;
        button.type = ObjectType::DestinationButton;
        button.name = buttonName;
        button.stationId = m_stationId;
        if (m_registry.addObject(button) != 0) {
            ++added;
        }
    }
    count("destinationButtons", added);
}

void StationTableCompiler::seedRoutes() {
    static const QRegularExpression integerPattern(QStringLiteral("\\d+"));

    int added = 0;
    for (const RendoTableRow& row : m_rows) {
        std::optional<RouteType> routeType = routeTypeForRow(row.name);
        if (!routeType) {
            continue;
        }

        const QString routeName = ObjectNames::routeName(m_stationId, row.start, row.end);
        if (m_registry.containsObject(routeName)) {
            continue;
        }

        const InterlockingObject* lever = m_registry.findObject(ObjectNames::leverName(m_stationId, row.start));
        if (!lever) {
            qWarning() << " [StationTableCompiler]" << m_stationId << "route" << routeName
                       << "has no lever, not seeded";
            continue;
        }
        const qulonglong leverId = lever->id;

        InterlockingObject route;
        route.type = ObjectType::Route;
        route.name = routeName;
        route.tcName = routeName;
        route.routeType = *routeType;
        route.indicator = row.indicator;

        QRegularExpressionMatch match = integerPattern.match(row.approachTime);
        if (match.hasMatch()) {
            route.approachLockTime = match.captured(0).toInt();
        }

        const qulonglong routeId = m_registry.addObject(route);
        if (routeId == 0) {
            continue;
        }
        ++added;

        RouteLeverDestinationButton association;
        association.routeId = routeId;
        association.leverId = leverId;
        association.destinationButtonName = ObjectNames::destinationButtonName(m_stationId, row.end);
        m_registry.addRouteLeverDestinationButton(association);
    }
    count("routes", added);
}

// === LOCK PHASE ===

CompileResult StationTableCompiler::compileLocks() {
    if (!m_registry.isFrozen()) {
        return CompileResult::missingUpstreamData("Lock phase started before all station objects were seeded")
            .setStationId(m_stationId);
    }

    Locking::NameResolver resolver(m_registry, m_config);
    Locking::LockGraphMaterializer materializer(m_registry, resolver);
    const int locksBefore = int(m_registry.locks().size());

    for (const RendoTableRow& row : m_rows) {
        if (!routeTypeForRow(row.name)) {
            continue;
        }

        const QString routeName = ObjectNames::routeName(m_stationId, row.start, row.end);
        const InterlockingObject* route = m_registry.findObject(routeName);
        if (!route || !route->isRoute()) {
            // Routes without a lever are never seeded
            if (!m_registry.containsObject(ObjectNames::leverName(m_stationId, row.start))) {
                qWarning() << " [StationTableCompiler]" << m_stationId << "skipping locks of unseeded route"
                           << routeName;
                continue;
            }
            return withContext(CompileResult::missingUpstreamData(
                QString("Route %1 not found").arg(routeName)).setToken(routeName), row);
        }

        if (m_registry.hasLocks(route->id)) {
            continue;
        }

        CompileResult result = compileRouteLocks(row, *route, materializer);
        if (!result.isOk()) {
            return withContext(result, row);
        }
    }

    CompileResult result = compileDetectorLocks(materializer);
    if (!result.isOk()) {
        return result;
    }

    count("locks", int(m_registry.locks().size()) - locksBefore);
    count("skippedLeaves", materializer.skippedLeafCount());
    qDebug() << " [StationTableCompiler]" << m_stationId << "locks:" << m_statistics;
    return CompileResult::ok();
}

CompileResult StationTableCompiler::compileRouteLocks(const RendoTableRow& row, const InterlockingObject& route,
                                                      Locking::LockGraphMaterializer& materializer) {
    using Locking::ParseMode;
    using Locking::ResolveStrategy;

    Locking::MaterializeRequest request;
    request.objectId = route.id;

    // Switching machines the route throws
    request.lockType = LockType::Lock;
    request.strategy = ResolveStrategy::SwitchingMachine;
    request.emitSwitchingMachineRoutes = true;
    CompileResult result = compileColumn(row.lockToSwitchingMachine, ParseMode::Default, request, materializer);
    if (!result.isOk()) return result;
    request.emitSwitchingMachineRoutes = false;

    // Other routes and track circuits
    request.strategy = ResolveStrategy::General;
    result = compileColumn(row.lockToRoute, ParseMode::Default, request, materializer);
    if (!result.isOk()) return result;

    // Total control comes from a separate table
    request.lockType = LockType::SignalControl;
    result = compileColumn(stripTotalControl(row.signalControl), ParseMode::Default, request, materializer);
    if (!result.isOk()) return result;

    request.lockType = LockType::RouteLock;
    result = compileColumn(row.routeLock, ParseMode::RouteLock, request, materializer);
    if (!result.isOk()) return result;

    if (m_config.isApproachLockExempt(m_stationId, row.start)) {
        qWarning() << " [StationTableCompiler]" << m_stationId << row.start << "is exempt from approach locking";
        return CompileResult::ok();
    }

    request.lockType = LockType::ApproachLock;
    request.strategy = ResolveStrategy::ApproachLock;
    return compileColumn(row.approachLock, ParseMode::Default, request, materializer);
}

CompileResult StationTableCompiler::compileDetectorLocks(Locking::LockGraphMaterializer& materializer) {
    const QString cutoff = m_config.detectorCutoffLever(m_stationId);

    for (const RendoTableRow& row : m_rows) {
        if (!isSwitchingMachineRow(row.name) || row.start.isEmpty()) {
            continue;
        }

        // Machines from the cut-off lever on are not modelled
        if (!cutoff.isEmpty() && row.start == cutoff) {
            qDebug() << " [StationTableCompiler]" << m_stationId << "detector locks stop at" << cutoff;
            break;
        }

        const QString machineName = ObjectNames::switchingMachineName(m_stationId, row.start);
        const InterlockingObject* switchingMachine = m_registry.findObject(machineName);
        if (!switchingMachine || !switchingMachine->isSwitchingMachine()) {
            return withContext(CompileResult::missingUpstreamData(
                QString("Switching machine %1 not found").arg(machineName)).setToken(machineName), row);
        }

        if (m_registry.hasLocks(switchingMachine->id)) {
            continue;
        }

        Locking::MaterializeRequest request;
        request.objectId = switchingMachine->id;
        request.lockType = LockType::Detector;
        request.strategy = Locking::ResolveStrategy::General;

        CompileResult result = compileColumn(row.signalControl, Locking::ParseMode::Default, request, materializer);
        if (!result.isOk()) {
            return withContext(result, row);
        }
    }
    return CompileResult::ok();
}

CompileResult StationTableCompiler::compileColumn(const QString& expression, Locking::ParseMode mode,
                                                  const Locking::MaterializeRequest& request,
                                                  Locking::LockGraphMaterializer& materializer) {
    Locking::ParseOutcome outcome = m_parser.parse(expression, mode);
    if (!outcome.result.isOk()) {
        return outcome.result;
    }
    return materializer.materialize(outcome.groups, request);
}

} // namespace RailSeed
