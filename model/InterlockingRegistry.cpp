#include "InterlockingRegistry.h"
#include <QDebug>

namespace RailSeed {

QString InterlockingRegistry::pairKey(const QString& first, const QString& second) {
    return first + QChar(0x1F) + second;
}

// === INTERLOCKING OBJECTS ===

qulonglong InterlockingRegistry::addObject(const InterlockingObject& object) {
    auto existing = m_objectIndexByName.constFind(object.name);
    if (existing != m_objectIndexByName.constEnd()) {
        return m_objects.rows().at(existing.value()).id;
    }

    if (m_frozen) {
        qCritical() << " [InterlockingRegistry] Object write after freeze rejected:" << object.name;
        return 0;
    }

    InterlockingObject row = object;
    if (row.id == 0) {
        row.id = ++m_lastObjectId;
    } else if (row.id > m_lastObjectId) {
        m_lastObjectId = row.id;
    }

    m_objectIndexByName.insert(row.name, m_objects.size());
    m_objectIndexById.insert(row.id, m_objects.size());
    m_objects.append(row);
    return row.id;
}

const InterlockingObject* InterlockingRegistry::findObject(const QString& name) const {
    auto it = m_objectIndexByName.constFind(name);
    if (it == m_objectIndexByName.constEnd()) {
        return nullptr;
    }
    return &m_objects.rows().at(it.value());
}

const InterlockingObject* InterlockingRegistry::findObjectById(qulonglong id) const {
    auto it = m_objectIndexById.constFind(id);
    if (it == m_objectIndexById.constEnd()) {
        return nullptr;
    }
    return &m_objects.rows().at(it.value());
}

QList<const InterlockingObject*> InterlockingRegistry::objectsOfType(ObjectType type) const {
    QList<const InterlockingObject*> result;
    for (const InterlockingObject& object : m_objects.rows()) {
        if (object.type == type) {
            result.append(&object);
        }
    }
    return result;
}

bool InterlockingRegistry::updateObjectStationId(qulonglong id, const QString& stationId) {
    auto it = m_objectIndexById.constFind(id);
    if (it == m_objectIndexById.constEnd()) {
        return false;
    }

    InterlockingObject& row = m_objects.rowAt(it.value());
    if (row.stationId == stationId) {
        return false;
    }
    row.stationId = stationId;
    if (it.value() < m_objects.committedCount()) {
        m_modifiedObjectIds.insert(id);
    }
    return true;
}

bool InterlockingRegistry::updateOperationNotificationDisplayName(qulonglong id, const QString& displayName) {
    auto it = m_objectIndexById.constFind(id);
    if (it == m_objectIndexById.constEnd()) {
        return false;
    }

    InterlockingObject& row = m_objects.rowAt(it.value());
    if (!row.isTrackCircuit() || row.operationNotificationDisplayName == displayName) {
        return false;
    }
    row.operationNotificationDisplayName = displayName;
    if (it.value() < m_objects.committedCount()) {
        m_modifiedObjectIds.insert(id);
    }
    return true;
}

QList<InterlockingObject> InterlockingRegistry::modifiedCommittedObjects() const {
    QList<InterlockingObject> result;
    for (qulonglong id : m_modifiedObjectIds) {
        if (const InterlockingObject* object = findObjectById(id)) {
            result.append(*object);
        }
    }
    return result;
}

void InterlockingRegistry::freezeObjects() {
    if (m_frozen) return;
    m_frozen = true;
    qDebug() << " [InterlockingRegistry] Objects frozen:" << m_objects.size() << "objects,"
             << m_routeIdsByLeverName.size() << "levers with routes";
}

// === TOPOLOGY ===

bool InterlockingRegistry::addStation(const Station& station) {
    if (m_stationNames.contains(station.name)) {
        return false;
    }
    m_stationNames.insert(station.name);
    m_stations.append(station);
    return true;
}

bool InterlockingRegistry::addStationTimerState(const StationTimerState& timerState) {
    QString key = pairKey(timerState.stationId, QString::number(timerState.seconds));
    if (m_stationTimerStateKeys.contains(key)) {
        return false;
    }
    m_stationTimerStateKeys.insert(key);
    m_stationTimerStates.append(timerState);
    return true;
}

bool InterlockingRegistry::addSignalType(const SignalType& signalType) {
    if (m_signalTypeNames.contains(signalType.name)) {
        return false;
    }
    m_signalTypeNames.insert(signalType.name);
    m_signalTypes.append(signalType);
    return true;
}

bool InterlockingRegistry::addRouteLeverDestinationButton(const RouteLeverDestinationButton& association) {
    if (m_routesWithLever.contains(association.routeId)) {
        return false;
    }

    const InterlockingObject* lever = findObjectById(association.leverId);
    if (!lever) {
        qWarning() << " [InterlockingRegistry] Route association references unknown lever id:" << association.leverId;
        return false;
    }

    m_routesWithLever.insert(association.routeId);
    m_routeIdsByLeverName[lever->name].append(association.routeId);
    m_routeLeverDestinationButtons.append(association);
    return true;
}

QList<qulonglong> InterlockingRegistry::routeIdsForLever(const QString& leverName) const {
    return m_routeIdsByLeverName.value(leverName);
}

bool InterlockingRegistry::addSignalRoute(const SignalRoute& signalRoute) {
    QString key = pairKey(signalRoute.signalName, QString::number(signalRoute.routeId));
    if (m_signalRouteKeys.contains(key)) {
        return false;
    }
    m_signalRouteKeys.insert(key);
    m_signalRoutes.append(signalRoute);
    return true;
}

bool InterlockingRegistry::addThrowOutControl(const ThrowOutControl& throwOutControl) {
    QString key = pairKey(QString::number(throwOutControl.sourceRouteId),
                          QString::number(throwOutControl.targetRouteId));
    if (m_throwOutControlKeys.contains(key)) {
        return false;
    }
    m_throwOutControlKeys.insert(key);
    m_throwOutControls.append(throwOutControl);
    return true;
}

bool InterlockingRegistry::addTrackCircuitSignal(const TrackCircuitSignal& trackCircuitSignal) {
    QString key = pairKey(QString::number(trackCircuitSignal.trackCircuitId),
                          trackCircuitSignal.signalName + (trackCircuitSignal.isUp ? "|U" : "|D"));
    if (m_trackCircuitSignalKeys.contains(key)) {
        return false;
    }
    m_trackCircuitSignalKeys.insert(key);
    m_trackCircuitSignals.append(trackCircuitSignal);
    return true;
}

bool InterlockingRegistry::addRouteLockTrackCircuit(const RouteLockTrackCircuit& routeLockTrackCircuit) {
    QString key = pairKey(QString::number(routeLockTrackCircuit.routeId),
                          QString::number(routeLockTrackCircuit.trackCircuitId));
    if (m_routeLockTrackCircuitKeys.contains(key)) {
        return false;
    }
    m_routeLockTrackCircuitKeys.insert(key);
    m_routeLockTrackCircuits.append(routeLockTrackCircuit);
    return true;
}

bool InterlockingRegistry::addOperationNotificationDisplay(const OperationNotificationDisplay& display) {
    if (m_operationNotificationDisplayNames.contains(display.name)) {
        return false;
    }
    m_operationNotificationDisplayNames.insert(display.name);
    m_operationNotificationDisplays.append(display);
    return true;
}

// === LOCK GRAPH ===

qulonglong InterlockingRegistry::addLock(const Lock& lock) {
    Lock row = lock;
    if (row.id == 0) {
        row.id = ++m_lastLockId;
    } else if (row.id > m_lastLockId) {
        m_lastLockId = row.id;
    }
    m_lockedObjectIds.insert(row.objectId);
    m_locks.append(row);
    return row.id;
}

qulonglong InterlockingRegistry::addLockCondition(const LockCondition& condition) {
    LockCondition row = condition;
    if (row.id == 0) {
        row.id = ++m_lastLockConditionId;
    } else if (row.id > m_lastLockConditionId) {
        m_lastLockConditionId = row.id;
    }
    m_lockConditions.append(row);
    return row.id;
}

qulonglong InterlockingRegistry::addLockConditionObject(const LockConditionObject& conditionObject) {
    LockConditionObject row = conditionObject;
    if (row.id == 0) {
        row.id = ++m_lastLockConditionObjectId;
    } else if (row.id > m_lastLockConditionObjectId) {
        m_lastLockConditionObjectId = row.id;
    }
    m_lockConditionObjects.append(row);
    return row.id;
}

void InterlockingRegistry::addSwitchingMachineRoute(const SwitchingMachineRoute& switchingMachineRoute) {
    m_switchingMachineRoutes.append(switchingMachineRoute);
}

// === NEXT SIGNALS ===

bool InterlockingRegistry::containsNextSignal(const QString& signalName, const QString& targetSignalName) const {
    return m_nextSignalKeys.contains(pairKey(signalName, targetSignalName));
}

bool InterlockingRegistry::addNextSignal(const NextSignal& nextSignal) {
    QString key = pairKey(nextSignal.signalName, nextSignal.targetSignalName);
    if (m_nextSignalKeys.contains(key)) {
        return false;
    }
    m_nextSignalKeys.insert(key);
    m_nextSignals.append(nextSignal);
    return true;
}

void InterlockingRegistry::markAllCommitted() {
    m_objects.markCommitted();
    m_modifiedObjectIds.clear();
    m_stations.markCommitted();
    m_stationTimerStates.markCommitted();
    m_operationNotificationDisplays.markCommitted();
    m_signalTypes.markCommitted();
    m_routeLeverDestinationButtons.markCommitted();
    m_signalRoutes.markCommitted();
    m_throwOutControls.markCommitted();
    m_trackCircuitSignals.markCommitted();
    m_routeLockTrackCircuits.markCommitted();
    m_locks.markCommitted();
    m_lockConditions.markCommitted();
    m_lockConditionObjects.markCommitted();
    m_switchingMachineRoutes.markCommitted();
    m_nextSignals.markCommitted();
}

int InterlockingRegistry::pendingRowCount() const {
    return int(m_objects.pendingCount() + m_modifiedObjectIds.size() + m_stations.pendingCount()
               + m_stationTimerStates.pendingCount() + m_operationNotificationDisplays.pendingCount()
               + m_signalTypes.pendingCount() + m_routeLeverDestinationButtons.pendingCount()
               + m_signalRoutes.pendingCount() + m_throwOutControls.pendingCount()
               + m_trackCircuitSignals.pendingCount() + m_routeLockTrackCircuits.pendingCount()
               + m_locks.pendingCount() + m_lockConditions.pendingCount()
               + m_lockConditionObjects.pendingCount() + m_switchingMachineRoutes.pendingCount()
               + m_nextSignals.pendingCount());
}

} // namespace RailSeed
