#pragma once
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include "InterlockingObject.h"
#include "LockModel.h"
#include "TopologyModel.h"

namespace RailSeed {

// Rows of one registry table. Rows up to committedCount() exist in the
// database; the rest are written by the next commit.
template <typename Row>
class RegistryTable {
public:
    const QList<Row>& rows() const { return m_rows; }
    qsizetype size() const { return m_rows.size(); }
    qsizetype committedCount() const { return m_committed; }
    qsizetype pendingCount() const { return m_rows.size() - m_committed; }
    QList<Row> pendingRows() const { return m_rows.mid(m_committed); }

    void append(const Row& row) { m_rows.append(row); }
    Row& rowAt(qsizetype index) { return m_rows[index]; }
    void markCommitted() { m_committed = m_rows.size(); }

private:
    QList<Row> m_rows;
    qsizetype m_committed = 0;
};

// Shared compilation context. Objects are written during seeding and frozen
// before the lock phase; the lock phase only reads objects and appends locks.
// Object pointers handed out stay valid while the registry is frozen.
class InterlockingRegistry {
public:
    InterlockingRegistry() = default;

    // === INTERLOCKING OBJECTS ===
    // Returns the id of the new object, or of the existing object with the same
    // name. Returns 0 when objects are frozen.
    qulonglong addObject(const InterlockingObject& object);
    const InterlockingObject* findObject(const QString& name) const;
    const InterlockingObject* findObjectById(qulonglong id) const;
    bool containsObject(const QString& name) const { return m_objectIndexByName.contains(name); }
    QList<const InterlockingObject*> objectsOfType(ObjectType type) const;
    bool updateObjectStationId(qulonglong id, const QString& stationId);
    bool updateOperationNotificationDisplayName(qulonglong id, const QString& displayName);

    const RegistryTable<InterlockingObject>& objects() const { return m_objects; }
    QList<InterlockingObject> modifiedCommittedObjects() const;

    void freezeObjects();
    bool isFrozen() const { return m_frozen; }

    // === TOPOLOGY ===
    bool addStation(const Station& station);
    const RegistryTable<Station>& stations() const { return m_stations; }

    bool addStationTimerState(const StationTimerState& timerState);
    const RegistryTable<StationTimerState>& stationTimerStates() const { return m_stationTimerStates; }

    bool addSignalType(const SignalType& signalType);
    const RegistryTable<SignalType>& signalTypes() const { return m_signalTypes; }

    bool addRouteLeverDestinationButton(const RouteLeverDestinationButton& association);
    QList<qulonglong> routeIdsForLever(const QString& leverName) const;
    const RegistryTable<RouteLeverDestinationButton>& routeLeverDestinationButtons() const {
        return m_routeLeverDestinationButtons;
    }

    bool addSignalRoute(const SignalRoute& signalRoute);
    const RegistryTable<SignalRoute>& signalRoutes() const { return m_signalRoutes; }

    bool addThrowOutControl(const ThrowOutControl& throwOutControl);
    const RegistryTable<ThrowOutControl>& throwOutControls() const { return m_throwOutControls; }

    bool addTrackCircuitSignal(const TrackCircuitSignal& trackCircuitSignal);
    const RegistryTable<TrackCircuitSignal>& trackCircuitSignals() const { return m_trackCircuitSignals; }

    bool addRouteLockTrackCircuit(const RouteLockTrackCircuit& routeLockTrackCircuit);
    const RegistryTable<RouteLockTrackCircuit>& routeLockTrackCircuits() const { return m_routeLockTrackCircuits; }

    bool addOperationNotificationDisplay(const OperationNotificationDisplay& display);
    bool containsOperationNotificationDisplay(const QString& name) const {
        return m_operationNotificationDisplayNames.contains(name);
    }
    const RegistryTable<OperationNotificationDisplay>& operationNotificationDisplays() const {
        return m_operationNotificationDisplays;
    }

    // === LOCK GRAPH ===
    bool hasLocks(qulonglong objectId) const { return m_lockedObjectIds.contains(objectId); }
    qulonglong addLock(const Lock& lock);
    qulonglong addLockCondition(const LockCondition& condition);
    qulonglong addLockConditionObject(const LockConditionObject& conditionObject);
    void addSwitchingMachineRoute(const SwitchingMachineRoute& switchingMachineRoute);

    const RegistryTable<Lock>& locks() const { return m_locks; }
    const RegistryTable<LockCondition>& lockConditions() const { return m_lockConditions; }
    const RegistryTable<LockConditionObject>& lockConditionObjects() const { return m_lockConditionObjects; }
    const RegistryTable<SwitchingMachineRoute>& switchingMachineRoutes() const { return m_switchingMachineRoutes; }

    // === NEXT SIGNALS ===
    bool containsNextSignal(const QString& signalName, const QString& targetSignalName) const;
    bool addNextSignal(const NextSignal& nextSignal);
    const RegistryTable<NextSignal>& nextSignals() const { return m_nextSignals; }

    // Everything currently held is treated as persisted.
    void markAllCommitted();
    int pendingRowCount() const;

private:
    static QString pairKey(const QString& first, const QString& second);

    bool m_frozen = false;

    RegistryTable<InterlockingObject> m_objects;
    QHash<QString, qsizetype> m_objectIndexByName;
    QHash<qulonglong, qsizetype> m_objectIndexById;
    QSet<qulonglong> m_modifiedObjectIds;
    qulonglong m_lastObjectId = 0;

    RegistryTable<Station> m_stations;
    QSet<QString> m_stationNames;
    RegistryTable<StationTimerState> m_stationTimerStates;
    QSet<QString> m_stationTimerStateKeys;
    RegistryTable<SignalType> m_signalTypes;
    QSet<QString> m_signalTypeNames;

    RegistryTable<RouteLeverDestinationButton> m_routeLeverDestinationButtons;
    QSet<qulonglong> m_routesWithLever;
    QHash<QString, QList<qulonglong>> m_routeIdsByLeverName;

    RegistryTable<SignalRoute> m_signalRoutes;
    QSet<QString> m_signalRouteKeys;
    RegistryTable<ThrowOutControl> m_throwOutControls;
    QSet<QString> m_throwOutControlKeys;
    RegistryTable<TrackCircuitSignal> m_trackCircuitSignals;
    QSet<QString> m_trackCircuitSignalKeys;
    RegistryTable<RouteLockTrackCircuit> m_routeLockTrackCircuits;
    QSet<QString> m_routeLockTrackCircuitKeys;
    RegistryTable<OperationNotificationDisplay> m_operationNotificationDisplays;
    QSet<QString> m_operationNotificationDisplayNames;

    RegistryTable<Lock> m_locks;
    QSet<qulonglong> m_lockedObjectIds;
    qulonglong m_lastLockId = 0;
    RegistryTable<LockCondition> m_lockConditions;
    qulonglong m_lastLockConditionId = 0;
    RegistryTable<LockConditionObject> m_lockConditionObjects;
    qulonglong m_lastLockConditionObjectId = 0;
    RegistryTable<SwitchingMachineRoute> m_switchingMachineRoutes;

    RegistryTable<NextSignal> m_nextSignals;
    QSet<QString> m_nextSignalKeys;
};

} // namespace RailSeed
