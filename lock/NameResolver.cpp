#include "NameResolver.h"
#include "../model/ObjectNames.h"
#include <QDebug>
#include <QRegularExpression>

namespace RailSeed::Locking {

namespace {

const QString PrefixTrackCircuitUp = QStringLiteral("上り");
const QString PrefixTrackCircuitDown = QStringLiteral("下り");

const QRegularExpression& leverPattern() {
    static const QRegularExpression pattern(QStringLiteral("(\\d+)[LR](Z?)"));
    return pattern;
}

const QRegularExpression& closurePattern() {
    static const QRegularExpression pattern(QStringLiteral("^(\\d+)T?$"));
    return pattern;
}

} // namespace

NameResolver::NameResolver(const InterlockingRegistry& registry, const CompilerConfig& config)
    : m_registry(registry), m_config(config) {}

Resolution NameResolver::resolve(const LockItem& item, ResolveStrategy strategy) const {
    Resolution resolution;

    switch (strategy) {
    case ResolveStrategy::SwitchingMachine:
        resolution.objects = searchSwitchingMachine(item);
        break;
    case ResolveStrategy::General:
        resolution.objects = searchGeneral(item);
        break;
    case ResolveStrategy::ApproachLock:
        resolution.objects = searchApproachLock(item, resolution.result);
        if (resolution.result.isFatal()) {
            return resolution;
        }
        break;
    }

    if (!resolution.objects.isEmpty()) {
        resolution.result = CompileResult::ok();
        return resolution;
    }

    if (item.name.endsWith('Z')) {
        resolution.result = CompileResult::skipped(
            QString("Guide route %1 at %2 has no object").arg(item.name, item.stationId))
            .setStationId(item.stationId)
            .setToken(item.name);
        return resolution;
    }

    if (m_config.isDirectionalLever(item.stationId, item.name)) {
        resolution.result = CompileResult::skipped(
            QString("Directional lever %1 at %2 is not modelled").arg(item.name, item.stationId))
            .setStationId(item.stationId)
            .setToken(item.name);
        return resolution;
    }

    resolution.result = CompileResult::unresolvedReference(
        QString("No object matches %1 at %2").arg(item.name, item.stationId))
        .setStationId(item.stationId)
        .setToken(item.name);
    return resolution;
}

QList<const InterlockingObject*> NameResolver::searchSwitchingMachine(const LockItem& item) const {
    const InterlockingObject* object =
        m_registry.findObject(ObjectNames::switchingMachineName(item.stationId, item.name));
    if (object && object->isSwitchingMachine()) {
        return {object};
    }
    return {};
}

QList<const InterlockingObject*> NameResolver::searchGeneral(const LockItem& item) const {
    // Single route or track circuit
    const QString key = ObjectNames::toFullWidth(ObjectNames::objectName(item.stationId, item.name));
    const InterlockingObject* object = m_registry.findObject(key);
    if (object && !object->isSwitchingMachine()) {
        return {object};
    }

    // Lever standing for every route it sets up
    QRegularExpressionMatch match = leverPattern().match(item.name);
    if (!match.hasMatch()) {
        return {};
    }

    const QString leverName = ObjectNames::leverName(item.stationId, match.captured(1) + match.captured(2));
    QList<const InterlockingObject*> routes;
    for (qulonglong routeId : m_registry.routeIdsForLever(leverName)) {
        const InterlockingObject* route = m_registry.findObjectById(routeId);
        if (route) {
            routes.append(route);
        } else {
            qWarning() << " [NameResolver] Lever" << leverName << "refers to unknown route id" << routeId;
        }
    }
    return routes;
}

QList<const InterlockingObject*> NameResolver::searchApproachLock(const LockItem& item, CompileResult& error) const {
    QList<const InterlockingObject*> result = searchGeneral(item);
    if (!result.isEmpty()) {
        return result;
    }

    // Block sections are numbered; single-track sections use the literal name
    bool ok = true;
    QString trackCircuitName = closureTrackCircuitName(item.name, &ok);
    if (!ok) {
        error = CompileResult::malformedExpression(
            QString("Block number %1 at %2 is out of range").arg(item.name, item.stationId))
            .setStationId(item.stationId)
            .setToken(item.name);
        return {};
    }
    if (trackCircuitName.isEmpty()) {
        trackCircuitName = item.name;
    }

    const InterlockingObject* trackCircuit = m_registry.findObject(trackCircuitName);
    if (trackCircuit && trackCircuit->isTrackCircuit()) {
        qDebug() << " [NameResolver] Approach token" << item.name << "->" << trackCircuitName;
        return {trackCircuit};
    }
    return {};
}

QString NameResolver::closureTrackCircuitName(const QString& token, bool* ok) {
    *ok = true;
    QRegularExpressionMatch match = closurePattern().match(token);
    if (!match.hasMatch()) {
        return QString();
    }

    const int number = match.captured(1).toInt(ok);
    if (!*ok) {
        return QString();
    }
    const QString& prefix = number % 2 == 0 ? PrefixTrackCircuitUp : PrefixTrackCircuitDown;
    return QString("%1%2T").arg(prefix).arg(number);
}

} // namespace RailSeed::Locking
