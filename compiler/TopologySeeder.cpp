#include "TopologySeeder.h"
#include "../model/ObjectNames.h"
#include <QDebug>
#include <QPair>

namespace RailSeed {

namespace {

const QString PrefixBlockSignalUp = QStringLiteral("上り閉塞");
const QString PrefixBlockSignalDown = QStringLiteral("下り閉塞");
const QString BlockMarker = QStringLiteral("閉塞");

const int StationTimerSeconds[] = {30, 60};

} // namespace

TopologySeeder::TopologySeeder(InterlockingRegistry& registry, const Table::TopologyDocument& document)
    : m_registry(registry), m_document(document) {}

CompileResult TopologySeeder::seed() {
    seedStations();
    seedStationTimerStates();
    seedTrackCircuits();
    seedSignalTypes();
    seedSignals();
    seedDirectNextSignals();
    seedTrackCircuitSignals();

    qDebug() << " [TopologySeeder] Topology seeded:" << m_statistics;
    return CompileResult::ok();
}

CompileResult TopologySeeder::seedPostAssociations() {
    seedSignalRoutes();

    CompileResult result = seedThrowOutControls();
    if (!result.isOk()) {
        return result;
    }

    backfillStationIds();
    return CompileResult::ok();
}

void TopologySeeder::count(const QString& key, int added) {
    m_statistics[key] = m_statistics.value(key).toInt() + added;
}

// === OBJECTS ===

void TopologySeeder::seedStations() {
    int added = 0;
    for (const Table::StationData& data : m_document.stations()) {
        Station station;
        station.id = data.id;
        station.name = data.name;
        station.isStation = data.isStation;
        station.isPassengerStation = data.isPassengerStation;
        if (m_registry.addStation(station)) {
            ++added;
        }
    }
    count("stations", added);
}

void TopologySeeder::seedStationTimerStates() {
    int added = 0;
    for (const Station& station : m_registry.stations().rows()) {
        if (!station.isStation) {
            continue;
        }

        for (int seconds : StationTimerSeconds) {
            StationTimerState timerState;
            timerState.stationId = station.id;
            timerState.seconds = seconds;
            if (m_registry.addStationTimerState(timerState)) {
                ++added;
            }
        }
    }
    count("stationTimerStates", added);
}

void TopologySeeder::seedTrackCircuits() {
    int added = 0;
    for (const Table::TrackCircuitData& data : m_document.trackCircuits()) {
        if (m_registry.containsObject(data.name)) {
            continue;
        }

        InterlockingObject trackCircuit;
        trackCircuit.type = ObjectType::TrackCircuit;
        trackCircuit.name = data.name;
        trackCircuit.protectionZone = data.protectionZone.value_or(99);
        if (m_registry.addObject(trackCircuit) != 0) {
            ++added;
        }
    }
    count("trackCircuits", added);
}

void TopologySeeder::seedSignalTypes() {
    int added = 0;
    for (const Table::SignalTypeData& data : m_document.signalTypes()) {
        SignalType signalType;
        signalType.name = data.name;
        signalType.rIndication = signalIndicationFromText(data.rIndication);
        signalType.yyIndication = signalIndicationFromText(data.yyIndication);
        signalType.yIndication = signalIndicationFromText(data.yIndication);
        signalType.ygIndication = signalIndicationFromText(data.ygIndication);
        signalType.gIndication = signalIndicationFromText(data.gIndication);
        if (m_registry.addSignalType(signalType)) {
            ++added;
        }
    }
    count("signalTypes", added);
}

void TopologySeeder::seedSignals() {
    int added = 0;
    for (const Table::SignalData& data : m_document.signalData()) {
        if (m_registry.containsObject(data.name)) {
            continue;
        }

        InterlockingObject signal;
        signal.type = ObjectType::Signal;
        signal.name = data.name;
        signal.signalTypeName = data.typeName;
        signal.stationId = stationIdForSignal(data.name);

        // Block signals protect the track circuit they are named after
        if (data.name.startsWith(PrefixBlockSignalUp) || data.name.startsWith(PrefixBlockSignalDown)) {
            QString trackCircuitName = data.name;
            trackCircuitName.remove(BlockMarker);
            trackCircuitName += "T";
            const InterlockingObject* trackCircuit = m_registry.findObject(trackCircuitName);
            if (trackCircuit && trackCircuit->isTrackCircuit()) {
                signal.trackCircuitId = trackCircuit->id;
            }
        }

        if (m_registry.addObject(signal) != 0) {
            ++added;
        }
    }
    count("signals", added);
}

void TopologySeeder::seedDirectNextSignals() {
    int added = 0;
    for (const Table::SignalData& data : m_document.signalData()) {
        for (const QString& nextSignalName : data.nextSignalNames) {
            NextSignal nextSignal;
            nextSignal.signalName = data.name;
            nextSignal.sourceSignalName = data.name;
            nextSignal.targetSignalName = nextSignalName;
            nextSignal.depth = 1;
            if (m_registry.addNextSignal(nextSignal)) {
                ++added;
            }
        }
    }
    count("nextSignals", added);
}

void TopologySeeder::seedTrackCircuitSignals() {
    int added = 0;
    for (const Table::TrackCircuitData& data : m_document.trackCircuits()) {
        const InterlockingObject* trackCircuit = m_registry.findObject(data.name);
        if (!trackCircuit || !trackCircuit->isTrackCircuit()) {
            continue;
        }

        auto addAll = [&](const QStringList& signalNames, bool isUp) {
            for (const QString& signalName : signalNames) {
                TrackCircuitSignal association;
                association.trackCircuitId = trackCircuit->id;
                association.signalName = signalName;
                association.isUp = isUp;
                if (m_registry.addTrackCircuitSignal(association)) {
                    ++added;
                }
            }
        };
        addAll(data.nextSignalNamesUp, true);
        addAll(data.nextSignalNamesDown, false);
    }
    count("trackCircuitSignals", added);
}

// === POST ASSOCIATIONS ===

void TopologySeeder::seedSignalRoutes() {
    int added = 0;
    for (const Table::SignalData& data : m_document.signalData()) {
        for (const QString& routeName : data.routeNames) {
            const InterlockingObject* route = findRoute(routeName);
            if (!route) {
                qWarning() << " [TopologySeeder] Signal" << data.name << "references unknown route" << routeName;
                continue;
            }

            SignalRoute signalRoute;
            signalRoute.signalName = data.name;
            signalRoute.routeId = route->id;
            if (m_registry.addSignalRoute(signalRoute)) {
                ++added;
            }
        }
    }
    count("signalRoutes", added);
}

CompileResult TopologySeeder::seedThrowOutControls() {
    int added = 0;
    for (const Table::ThrowOutControlData& data : m_document.throwOutControls()) {
        // Lever-conditioned throw-out needs directional levers
        if (!data.leverConditionName.isEmpty()) {
            qDebug() << " [TopologySeeder] Skipping lever-conditioned throw-out control"
                     << data.sourceRouteName << "->" << data.targetRouteName;
            continue;
        }

        const InterlockingObject* source = findRoute(data.sourceRouteName);
        if (!source) {
            return CompileResult::missingUpstreamData(
                QString("Throw-out control source route not found: %1").arg(data.sourceRouteName))
                .setToken(data.sourceRouteName);
        }

        const InterlockingObject* target = findRoute(data.targetRouteName);
        if (!target) {
            return CompileResult::missingUpstreamData(
                QString("Throw-out control target route not found: %1").arg(data.targetRouteName))
                .setToken(data.targetRouteName);
        }

        ThrowOutControl throwOutControl;
        throwOutControl.sourceRouteId = source->id;
        throwOutControl.targetRouteId = target->id;
        if (m_registry.addThrowOutControl(throwOutControl)) {
            ++added;
        }
    }
    count("throwOutControls", added);
    return CompileResult::ok();
}

void TopologySeeder::backfillStationIds() {
    QList<QPair<qulonglong, QString>> updates;
    for (const InterlockingObject& object : m_registry.objects().rows()) {
        const QString stationId = ObjectNames::stationIdFromName(object.name);
        if (!stationId.isEmpty() && object.stationId.isEmpty()) {
            updates.append({object.id, stationId});
        }
    }

    int updated = 0;
    for (const auto& update : updates) {
        if (m_registry.updateObjectStationId(update.first, update.second)) {
            ++updated;
        }
    }
    count("stationIdsUpdated", updated);
}

QString TopologySeeder::stationIdForSignal(const QString& signalName) const {
    for (const Station& station : m_registry.stations().rows()) {
        if (!station.name.isEmpty() && signalName.startsWith(station.name)) {
            return station.id;
        }
    }
    return QString();
}

const InterlockingObject* TopologySeeder::findRoute(const QString& name) const {
    const InterlockingObject* object = m_registry.findObject(name);
    return object && object->isRoute() ? object : nullptr;
}

} // namespace RailSeed
