#include "DatabaseManager.h"
#include <QDateTime>
#include <QElapsedTimer>
#include <QMetaType>
#include <optional>

namespace RailSeed {

namespace {

QVariant idValue(qulonglong id) {
    return QVariant(qlonglong(id));
}

QVariant optionalId(const std::optional<qulonglong>& id) {
    return id ? idValue(*id) : QVariant(QMetaType::fromType<qlonglong>());
}

QVariant optionalInt(const std::optional<int>& value) {
    return value ? QVariant(*value) : QVariant(QMetaType::fromType<int>());
}

QVariant nullText() {
    return QVariant(QMetaType::fromType<QString>());
}

std::optional<qulonglong> readOptionalId(const QVariant& value) {
    if (value.isNull()) return std::nullopt;
    return value.toULongLong();
}

std::optional<int> readOptionalInt(const QVariant& value) {
    if (value.isNull()) return std::nullopt;
    return value.toInt();
}

QString dropName() {
    return raiseDropName(RaiseDrop::Drop);
}

ReverseState reverseState(bool isReverse) {
    return isReverse ? ReverseState::Reversed : ReverseState::Normal;
}

} // namespace

DatabaseManager::DatabaseManager(QObject* parent)
    : QObject(parent)
{
}

DatabaseManager::~DatabaseManager() {
    cleanup();
}

QSqlDatabase DatabaseManager::getDatabase() const {
    return db;
}

bool DatabaseManager::connectToDatabase(const DatabaseSettings& settings) {
    cleanup();

    m_connectionName = settings.connectionName;
    if (QSqlDatabase::contains(m_connectionName)) {
        qDebug() << " [DatabaseManager] Removing stale connection" << m_connectionName;
        QSqlDatabase::removeDatabase(m_connectionName);
    }

    if (!QSqlDatabase::isDriverAvailable(settings.driver)) {
        setError(QString("SQL driver %1 is not available (installed: %2)")
                     .arg(settings.driver, QSqlDatabase::drivers().join(", ")));
        return false;
    }

    db = QSqlDatabase::addDatabase(settings.driver, m_connectionName);
    db.setDatabaseName(settings.databaseName);
    if (settings.driver != "QSQLITE") {
        db.setHostName(settings.hostName);
        db.setPort(settings.port);
        db.setUserName(settings.userName);
        db.setPassword(settings.password);
    }

    if (!db.open()) {
        logError("connectToDatabase", db.lastError());
        setError(QString("Connection to %1 failed: %2").arg(settings.databaseName, db.lastError().text()));
        connected = false;
        emit connectionStateChanged(connected);
        return false;
    }

    connected = true;
    emit connectionStateChanged(connected);
    qDebug() << " [DatabaseManager] Connected to" << settings.driver << settings.databaseName;
    return true;
}

void DatabaseManager::cleanup() {
    if (db.isOpen()) {
        db.close();
    }
    db = QSqlDatabase();

    if (!m_connectionName.isEmpty() && QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }

    if (connected) {
        connected = false;
        emit connectionStateChanged(connected);
    }
}

// === REGISTRY PERSISTENCE ===

bool DatabaseManager::loadRegistry(InterlockingRegistry& registry) {
    if (!connected) {
        setError("loadRegistry called without a connection");
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    if (!loadStations(registry)) return false;
    if (!loadStationTimerStates(registry)) return false;
    if (!loadSignalTypes(registry)) return false;
    if (!loadObjects(registry)) return false;
    if (!loadAssociations(registry)) return false;
    if (!loadLockGraph(registry)) return false;
    if (!loadNextSignals(registry)) return false;
    if (!loadOperationNotificationDisplays(registry)) return false;

    registry.markAllCommitted();
    qDebug() << " [DatabaseManager] Registry loaded:" << registry.objects().size() << "objects,"
             << registry.locks().size() << "locks," << registry.nextSignals().size() << "next signals in"
             << timer.elapsed() << "ms";
    return true;
}

bool DatabaseManager::commitRegistry(InterlockingRegistry& registry) {
    if (!connected) {
        setError("commitRegistry called without a connection");
        return false;
    }

    const int rowCount = registry.pendingRowCount();
    if (rowCount == 0) {
        qDebug() << " [DatabaseManager] Nothing to commit";
        emit registryCommitted(0);
        return true;
    }

    if (!db.transaction()) {
        logError("commitRegistry", db.lastError());
        setError(QString("Failed to start transaction: %1").arg(db.lastError().text()));
        return false;
    }

    const bool success = insertStations(registry)
        && insertStationTimerStates(registry)
        && insertSignalTypes(registry)
        && insertObjects(registry)
        && insertObjectStates(registry)
        && updateModifiedObjects(registry)
        && insertAssociations(registry)
        && insertLockGraph(registry)
        && insertNextSignals(registry)
        && insertOperationNotificationDisplays(registry);

    if (!success) {
        qCritical() << " [DatabaseManager] Commit failed, rolling back:" << m_lastError;
        if (!db.rollback()) {
            logError("rollback", db.lastError());
        }
        return false;
    }

    if (!db.commit()) {
        logError("commit", db.lastError());
        setError(QString("Commit failed: %1").arg(db.lastError().text()));
        if (!db.rollback()) {
            logError("rollback", db.lastError());
        }
        return false;
    }

    registry.markAllCommitted();
    qDebug() << " [DatabaseManager] Committed" << rowCount << "rows";
    emit registryCommitted(rowCount);
    return true;
}

// === LOADING ===

bool DatabaseManager::loadStations(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT id, name, is_station, is_passenger_station FROM station")) {
        logError("loadStations", query.lastError());
        setError(QString("Cannot read stations: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        Station station;
        station.id = query.value(0).toString();
        station.name = query.value(1).toString();
        station.isStation = query.value(2).toBool();
        station.isPassengerStation = query.value(3).toBool();
        registry.addStation(station);
    }
    return true;
}

bool DatabaseManager::loadStationTimerStates(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT station_id, seconds, is_teu_relay_raised, is_ten_relay_raised, is_ter_relay_raised "
                    "FROM station_timer_state")) {
        logError("loadStationTimerStates", query.lastError());
        setError(QString("Cannot read station timer states: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        StationTimerState timerState;
        timerState.stationId = query.value(0).toString();
        timerState.seconds = query.value(1).toInt();
        timerState.teuRelay = raiseDropFromName(query.value(2).toString());
        timerState.tenRelay = raiseDropFromName(query.value(3).toString());
        timerState.terRelay = raiseDropFromName(query.value(4).toString());
        registry.addStationTimerState(timerState);
    }
    return true;
}

bool DatabaseManager::loadSignalTypes(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT name, r_indication, yy_indication, y_indication, yg_indication, g_indication "
                    "FROM signal_type")) {
        logError("loadSignalTypes", query.lastError());
        setError(QString("Cannot read signal types: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        SignalType signalType;
        signalType.name = query.value(0).toString();
        signalType.rIndication = signalIndicationFromText(query.value(1).toString());
        signalType.yyIndication = signalIndicationFromText(query.value(2).toString());
        signalType.yIndication = signalIndicationFromText(query.value(3).toString());
        signalType.ygIndication = signalIndicationFromText(query.value(4).toString());
        signalType.gIndication = signalIndicationFromText(query.value(5).toString());
        registry.addSignalType(signalType);
    }
    return true;
}

bool DatabaseManager::loadObjects(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT id, type, name, station_id, tc_name, route_type, indicator, approach_lock_time, "
                    "lever_type, switching_machine_id, protection_zone, signal_type_name, track_circuit_id, "
                    "operation_notification_display_name FROM interlocking_object ORDER BY id")) {
        logError("loadObjects", query.lastError());
        setError(QString("Cannot read interlocking objects: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        std::optional<ObjectType> type = objectTypeFromName(query.value(1).toString());
        if (!type) {
            setError(QString("Unknown object type '%1' for %2")
                         .arg(query.value(1).toString(), query.value(2).toString()));
            return false;
        }

        InterlockingObject object;
        object.id = query.value(0).toULongLong();
        object.type = *type;
        object.name = query.value(2).toString();
        object.stationId = query.value(3).toString();
        object.tcName = query.value(4).toString();
        if (std::optional<RouteType> routeType = routeTypeFromName(query.value(5).toString())) {
            object.routeType = *routeType;
        }
        object.indicator = query.value(6).toString();
        object.approachLockTime = readOptionalInt(query.value(7));
        if (std::optional<LeverType> leverType = leverTypeFromName(query.value(8).toString())) {
            object.leverType = *leverType;
        }
        object.switchingMachineId = readOptionalId(query.value(9));
        object.protectionZone = query.value(10).isNull() ? 99 : query.value(10).toInt();
        object.signalTypeName = query.value(11).toString();
        object.trackCircuitId = readOptionalId(query.value(12));
        object.operationNotificationDisplayName = query.value(13).toString();

        registry.addObject(object);
    }
    return true;
}

bool DatabaseManager::loadAssociations(InterlockingRegistry& registry) {
    QSqlQuery query(db);

    if (!query.exec("SELECT route_id, lever_id, destination_button_name FROM route_lever_destination_button")) {
        logError("loadAssociations", query.lastError());
        setError(QString("Cannot read route levers: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        RouteLeverDestinationButton association;
        association.routeId = query.value(0).toULongLong();
        association.leverId = query.value(1).toULongLong();
        association.destinationButtonName = query.value(2).toString();
        registry.addRouteLeverDestinationButton(association);
    }

    if (!query.exec("SELECT signal_name, route_id FROM signal_route")) {
        logError("loadAssociations", query.lastError());
        setError(QString("Cannot read signal routes: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        SignalRoute signalRoute;
        signalRoute.signalName = query.value(0).toString();
        signalRoute.routeId = query.value(1).toULongLong();
        registry.addSignalRoute(signalRoute);
    }

    if (!query.exec("SELECT source_route_id, target_route_id FROM throw_out_control")) {
        logError("loadAssociations", query.lastError());
        setError(QString("Cannot read throw-out controls: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        ThrowOutControl throwOutControl;
        throwOutControl.sourceRouteId = query.value(0).toULongLong();
        throwOutControl.targetRouteId = query.value(1).toULongLong();
        registry.addThrowOutControl(throwOutControl);
    }

    if (!query.exec("SELECT track_circuit_id, signal_name, is_up FROM track_circuit_signal")) {
        logError("loadAssociations", query.lastError());
        setError(QString("Cannot read track circuit signals: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        TrackCircuitSignal trackCircuitSignal;
        trackCircuitSignal.trackCircuitId = query.value(0).toULongLong();
        trackCircuitSignal.signalName = query.value(1).toString();
        trackCircuitSignal.isUp = query.value(2).toBool();
        registry.addTrackCircuitSignal(trackCircuitSignal);
    }

    if (!query.exec("SELECT route_id, track_circuit_id FROM route_lock_track_circuit")) {
        logError("loadAssociations", query.lastError());
        setError(QString("Cannot read route lock track circuits: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        RouteLockTrackCircuit routeLockTrackCircuit;
        routeLockTrackCircuit.routeId = query.value(0).toULongLong();
        routeLockTrackCircuit.trackCircuitId = query.value(1).toULongLong();
        registry.addRouteLockTrackCircuit(routeLockTrackCircuit);
    }

    return true;
}

bool DatabaseManager::loadLockGraph(InterlockingRegistry& registry) {
    QSqlQuery query(db);

    if (!query.exec("SELECT id, object_id, type, route_lock_group FROM \"lock\" ORDER BY id")) {
        logError("loadLockGraph", query.lastError());
        setError(QString("Cannot read locks: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        std::optional<LockType> type = lockTypeFromName(query.value(2).toString());
        if (!type) {
            setError(QString("Unknown lock type '%1'").arg(query.value(2).toString()));
            return false;
        }
        Lock lock;
        lock.id = query.value(0).toULongLong();
        lock.objectId = query.value(1).toULongLong();
        lock.type = *type;
        lock.routeLockGroup = query.value(3).toInt();
        registry.addLock(lock);
    }

    if (!query.exec("SELECT id, lock_id, type, parent_id FROM lock_condition ORDER BY id")) {
        logError("loadLockGraph", query.lastError());
        setError(QString("Cannot read lock conditions: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        std::optional<LockConditionType> type = lockConditionTypeFromName(query.value(2).toString());
        if (!type) {
            setError(QString("Unknown lock condition type '%1'").arg(query.value(2).toString()));
            return false;
        }
        LockCondition condition;
        condition.id = query.value(0).toULongLong();
        condition.lockId = query.value(1).toULongLong();
        condition.type = *type;
        condition.parentId = readOptionalId(query.value(3));
        registry.addLockCondition(condition);
    }

    if (!query.exec("SELECT id, lock_id, object_id, parent_id, timer_seconds, is_reverse "
                    "FROM lock_condition_object ORDER BY id")) {
        logError("loadLockGraph", query.lastError());
        setError(QString("Cannot read lock condition objects: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        LockConditionObject conditionObject;
        conditionObject.id = query.value(0).toULongLong();
        conditionObject.lockId = query.value(1).toULongLong();
        conditionObject.objectId = query.value(2).toULongLong();
        conditionObject.parentId = readOptionalId(query.value(3));
        conditionObject.timerSeconds = readOptionalInt(query.value(4));
        conditionObject.isReverse = reverseState(query.value(5).toBool());
        registry.addLockConditionObject(conditionObject);
    }

    if (!query.exec("SELECT route_id, switching_machine_id, is_reverse FROM switching_machine_route")) {
        logError("loadLockGraph", query.lastError());
        setError(QString("Cannot read switching machine routes: %1").arg(query.lastError().text()));
        return false;
    }
    while (query.next()) {
        SwitchingMachineRoute switchingMachineRoute;
        switchingMachineRoute.routeId = query.value(0).toULongLong();
        switchingMachineRoute.switchingMachineId = query.value(1).toULongLong();
        switchingMachineRoute.isReverse = reverseState(query.value(2).toBool());
        registry.addSwitchingMachineRoute(switchingMachineRoute);
    }

    return true;
}

bool DatabaseManager::loadNextSignals(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT signal_name, source_signal_name, target_signal_name, depth "
                    "FROM next_signal ORDER BY depth")) {
        logError("loadNextSignals", query.lastError());
        setError(QString("Cannot read next signals: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        NextSignal nextSignal;
        nextSignal.signalName = query.value(0).toString();
        nextSignal.sourceSignalName = query.value(1).toString();
        nextSignal.targetSignalName = query.value(2).toString();
        nextSignal.depth = query.value(3).toInt();
        registry.addNextSignal(nextSignal);
    }
    return true;
}

bool DatabaseManager::loadOperationNotificationDisplays(InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!query.exec("SELECT name, station_id, is_up, is_down FROM operation_notification_display")) {
        logError("loadOperationNotificationDisplays", query.lastError());
        setError(QString("Cannot read operation notification displays: %1").arg(query.lastError().text()));
        return false;
    }

    while (query.next()) {
        OperationNotificationDisplay display;
        display.name = query.value(0).toString();
        display.stationId = query.value(1).toString();
        display.isUp = query.value(2).toBool();
        display.isDown = query.value(3).toBool();
        registry.addOperationNotificationDisplay(display);
    }
    return true;
}

// === WRITING ===

bool DatabaseManager::insertStations(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "INSERT INTO station (id, name, is_station, is_passenger_station) VALUES (?, ?, ?, ?)",
                 "insertStations")) {
        return false;
    }

    for (const Station& station : registry.stations().pendingRows()) {
        query.addBindValue(station.id);
        query.addBindValue(station.name);
        query.addBindValue(station.isStation);
        query.addBindValue(station.isPassengerStation);
        if (!execute(query, "insertStations")) return false;
    }
    return true;
}

bool DatabaseManager::insertStationTimerStates(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "INSERT INTO station_timer_state (station_id, seconds, is_teu_relay_raised, "
                        "is_ten_relay_raised, is_ter_relay_raised) VALUES (?, ?, ?, ?, ?)",
                 "insertStationTimerStates")) {
        return false;
    }

    for (const StationTimerState& timerState : registry.stationTimerStates().pendingRows()) {
        query.addBindValue(timerState.stationId);
        query.addBindValue(timerState.seconds);
        query.addBindValue(raiseDropName(timerState.teuRelay));
        query.addBindValue(raiseDropName(timerState.tenRelay));
        query.addBindValue(raiseDropName(timerState.terRelay));
        if (!execute(query, "insertStationTimerStates")) return false;
    }
    return true;
}

bool DatabaseManager::insertSignalTypes(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "INSERT INTO signal_type (name, r_indication, yy_indication, y_indication, "
                        "yg_indication, g_indication) VALUES (?, ?, ?, ?, ?, ?)",
                 "insertSignalTypes")) {
        return false;
    }

    for (const SignalType& signalType : registry.signalTypes().pendingRows()) {
        query.addBindValue(signalType.name);
        query.addBindValue(signalIndicationName(signalType.rIndication));
        query.addBindValue(signalIndicationName(signalType.yyIndication));
        query.addBindValue(signalIndicationName(signalType.yIndication));
        query.addBindValue(signalIndicationName(signalType.ygIndication));
        query.addBindValue(signalIndicationName(signalType.gIndication));
        if (!execute(query, "insertSignalTypes")) return false;
    }
    return true;
}

bool DatabaseManager::insertObjects(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "INSERT INTO interlocking_object (id, type, name, station_id, tc_name, route_type, "
                        "indicator, approach_lock_time, lever_type, switching_machine_id, protection_zone, "
                        "signal_type_name, track_circuit_id, operation_notification_display_name) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                 "insertObjects")) {
        return false;
    }

    for (const InterlockingObject& object : registry.objects().pendingRows()) {
        const bool isLever = object.type == ObjectType::Lever;
        const bool hasTcName = object.isRoute() || object.isSwitchingMachine();

        query.addBindValue(idValue(object.id));
        query.addBindValue(objectTypeName(object.type));
        query.addBindValue(object.name);
        query.addBindValue(object.stationId.isEmpty() ? nullText() : QVariant(object.stationId));
        query.addBindValue(hasTcName ? QVariant(object.tcName) : nullText());
        query.addBindValue(object.isRoute() ? QVariant(routeTypeName(object.routeType)) : nullText());
        query.addBindValue(object.isRoute() ? QVariant(object.indicator) : nullText());
        query.addBindValue(optionalInt(object.approachLockTime));
        query.addBindValue(isLever ? QVariant(leverTypeName(object.leverType)) : nullText());
        query.addBindValue(optionalId(object.switchingMachineId));
        query.addBindValue(object.isTrackCircuit() ? QVariant(object.protectionZone)
                                                   : QVariant(QMetaType::fromType<int>()));
        query.addBindValue(object.type == ObjectType::Signal ? QVariant(object.signalTypeName) : nullText());
        query.addBindValue(optionalId(object.trackCircuitId));
        query.addBindValue(object.operationNotificationDisplayName.isEmpty()
                               ? nullText() : QVariant(object.operationNotificationDisplayName));
        if (!execute(query, "insertObjects")) return false;
    }
    return true;
}

bool DatabaseManager::insertObjectStates(const InterlockingRegistry& registry) {
    const QDateTime dayAgo = QDateTime::currentDateTime().addDays(-1);
    const QString drop = dropName();

    QSqlQuery trackCircuitQuery(db);
    QSqlQuery signalQuery(db);
    QSqlQuery switchingMachineQuery(db);
    QSqlQuery leverQuery(db);
    QSqlQuery destinationButtonQuery(db);
    QSqlQuery routeQuery(db);
    if (!prepare(trackCircuitQuery, "INSERT INTO track_circuit_state (id, is_short_circuit, is_locked, train_number, "
                                    "is_correction_drop_relay_raised, is_correction_raise_relay_raised, dropped_at, "
                                    "raised_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)", "insertObjectStates")
        || !prepare(signalQuery, "INSERT INTO signal_state (id, is_lighted) VALUES (?, ?)", "insertObjectStates")
        || !prepare(switchingMachineQuery, "INSERT INTO switching_machine_state (id, is_switching, is_reverse, "
                                           "switch_end_time) VALUES (?, ?, ?, ?)", "insertObjectStates")
        || !prepare(leverQuery, "INSERT INTO lever_state (id, is_reversed) VALUES (?, ?)", "insertObjectStates")
        || !prepare(destinationButtonQuery, "INSERT INTO destination_button_state (id, is_raised, operated_at) "
                                            "VALUES (?, ?, ?)", "insertObjectStates")
        || !prepare(routeQuery, "INSERT INTO route_state (id, is_lever_relay_raised, is_route_relay_raised, "
                                "is_signal_control_raised, is_approach_lock_mr_raised, is_approach_lock_ms_raised, "
                                "is_route_lock_raised) VALUES (?, ?, ?, ?, ?, ?, ?)", "insertObjectStates")) {
        return false;
    }

    for (const InterlockingObject& object : registry.objects().pendingRows()) {
        QSqlQuery* query = nullptr;
        switch (object.type) {
        case ObjectType::TrackCircuit:
            query = &trackCircuitQuery;
            query->addBindValue(idValue(object.id));
            query->addBindValue(false);
            query->addBindValue(false);
            query->addBindValue(QString(""));
            query->addBindValue(drop);
            query->addBindValue(drop);
            query->addBindValue(QVariant(QMetaType::fromType<QDateTime>()));
            query->addBindValue(QVariant(QMetaType::fromType<QDateTime>()));
            break;
        case ObjectType::Signal:
            query = &signalQuery;
            query->addBindValue(idValue(object.id));
            query->addBindValue(true);
            break;
        case ObjectType::SwitchingMachine:
            query = &switchingMachineQuery;
            query->addBindValue(idValue(object.id));
            query->addBindValue(false);
            query->addBindValue(false);
            query->addBindValue(dayAgo);
            break;
        case ObjectType::Lever:
            query = &leverQuery;
            query->addBindValue(idValue(object.id));
            query->addBindValue(QString("Center"));
            break;
        case ObjectType::DestinationButton:
            query = &destinationButtonQuery;
            query->addBindValue(idValue(object.id));
            query->addBindValue(drop);
            query->addBindValue(dayAgo);
            break;
        case ObjectType::Route:
            query = &routeQuery;
            query->addBindValue(idValue(object.id));
            for (int relay = 0; relay < 6; ++relay) {
                query->addBindValue(drop);
            }
            break;
        }
        if (!execute(*query, "insertObjectStates")) return false;
    }
    return true;
}

bool DatabaseManager::updateModifiedObjects(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "UPDATE interlocking_object SET station_id = ?, operation_notification_display_name = ? "
                        "WHERE id = ?", "updateModifiedObjects")) {
        return false;
    }

    for (const InterlockingObject& object : registry.modifiedCommittedObjects()) {
        query.addBindValue(object.stationId.isEmpty() ? nullText() : QVariant(object.stationId));
        query.addBindValue(object.operationNotificationDisplayName.isEmpty()
                               ? nullText() : QVariant(object.operationNotificationDisplayName));
        query.addBindValue(idValue(object.id));
        if (!execute(query, "updateModifiedObjects")) return false;
    }
    return true;
}

bool DatabaseManager::insertAssociations(const InterlockingRegistry& registry) {
    QSqlQuery query(db);

    if (!prepare(query, "INSERT INTO route_lever_destination_button (route_id, lever_id, destination_button_name) "
                        "VALUES (?, ?, ?)", "insertAssociations")) {
        return false;
    }
    for (const RouteLeverDestinationButton& association : registry.routeLeverDestinationButtons().pendingRows()) {
        query.addBindValue(idValue(association.routeId));
        query.addBindValue(idValue(association.leverId));
        query.addBindValue(association.destinationButtonName);
        if (!execute(query, "insertAssociations")) return false;
    }

    if (!prepare(query, "INSERT INTO signal_route (signal_name, route_id) VALUES (?, ?)", "insertAssociations")) {
        return false;
    }
    for (const SignalRoute& signalRoute : registry.signalRoutes().pendingRows()) {
        query.addBindValue(signalRoute.signalName);
        query.addBindValue(idValue(signalRoute.routeId));
        if (!execute(query, "insertAssociations")) return false;
    }

    if (!prepare(query, "INSERT INTO throw_out_control (source_route_id, target_route_id) VALUES (?, ?)",
                 "insertAssociations")) {
        return false;
    }
    for (const ThrowOutControl& throwOutControl : registry.throwOutControls().pendingRows()) {
        query.addBindValue(idValue(throwOutControl.sourceRouteId));
        query.addBindValue(idValue(throwOutControl.targetRouteId));
        if (!execute(query, "insertAssociations")) return false;
    }

    if (!prepare(query, "INSERT INTO track_circuit_signal (track_circuit_id, signal_name, is_up) VALUES (?, ?, ?)",
                 "insertAssociations")) {
        return false;
    }
    for (const TrackCircuitSignal& trackCircuitSignal : registry.trackCircuitSignals().pendingRows()) {
        query.addBindValue(idValue(trackCircuitSignal.trackCircuitId));
        query.addBindValue(trackCircuitSignal.signalName);
        query.addBindValue(trackCircuitSignal.isUp);
        if (!execute(query, "insertAssociations")) return false;
    }

    if (!prepare(query, "INSERT INTO route_lock_track_circuit (route_id, track_circuit_id) VALUES (?, ?)",
                 "insertAssociations")) {
        return false;
    }
    for (const RouteLockTrackCircuit& routeLockTrackCircuit : registry.routeLockTrackCircuits().pendingRows()) {
        query.addBindValue(idValue(routeLockTrackCircuit.routeId));
        query.addBindValue(idValue(routeLockTrackCircuit.trackCircuitId));
        if (!execute(query, "insertAssociations")) return false;
    }

    return true;
}

bool DatabaseManager::insertLockGraph(const InterlockingRegistry& registry) {
    QSqlQuery query(db);

    if (!prepare(query, "INSERT INTO \"lock\" (id, object_id, type, route_lock_group) VALUES (?, ?, ?, ?)",
                 "insertLockGraph")) {
        return false;
    }
    for (const Lock& lock : registry.locks().pendingRows()) {
        query.addBindValue(idValue(lock.id));
        query.addBindValue(idValue(lock.objectId));
        query.addBindValue(lockTypeName(lock.type));
        query.addBindValue(lock.routeLockGroup);
        if (!execute(query, "insertLockGraph")) return false;
    }

    if (!prepare(query, "INSERT INTO lock_condition (id, lock_id, type, parent_id) VALUES (?, ?, ?, ?)",
                 "insertLockGraph")) {
        return false;
    }
    for (const LockCondition& condition : registry.lockConditions().pendingRows()) {
        query.addBindValue(idValue(condition.id));
        query.addBindValue(idValue(condition.lockId));
        query.addBindValue(lockConditionTypeName(condition.type));
        query.addBindValue(optionalId(condition.parentId));
        if (!execute(query, "insertLockGraph")) return false;
    }

    if (!prepare(query, "INSERT INTO lock_condition_object (id, lock_id, object_id, parent_id, timer_seconds, "
                        "is_reverse) VALUES (?, ?, ?, ?, ?, ?)", "insertLockGraph")) {
        return false;
    }
    for (const LockConditionObject& conditionObject : registry.lockConditionObjects().pendingRows()) {
        query.addBindValue(idValue(conditionObject.id));
        query.addBindValue(idValue(conditionObject.lockId));
        query.addBindValue(idValue(conditionObject.objectId));
        query.addBindValue(optionalId(conditionObject.parentId));
        query.addBindValue(optionalInt(conditionObject.timerSeconds));
        query.addBindValue(conditionObject.isReverse == ReverseState::Reversed);
        if (!execute(query, "insertLockGraph")) return false;
    }

    if (!prepare(query, "INSERT INTO switching_machine_route (route_id, switching_machine_id, is_reverse) "
                        "VALUES (?, ?, ?)", "insertLockGraph")) {
        return false;
    }
    for (const SwitchingMachineRoute& switchingMachineRoute : registry.switchingMachineRoutes().pendingRows()) {
        query.addBindValue(idValue(switchingMachineRoute.routeId));
        query.addBindValue(idValue(switchingMachineRoute.switchingMachineId));
        query.addBindValue(switchingMachineRoute.isReverse == ReverseState::Reversed);
        if (!execute(query, "insertLockGraph")) return false;
    }

    return true;
}

bool DatabaseManager::insertNextSignals(const InterlockingRegistry& registry) {
    QSqlQuery query(db);
    if (!prepare(query, "INSERT INTO next_signal (signal_name, source_signal_name, target_signal_name, depth) "
                        "VALUES (?, ?, ?, ?)", "insertNextSignals")) {
        return false;
    }

    for (const NextSignal& nextSignal : registry.nextSignals().pendingRows()) {
        query.addBindValue(nextSignal.signalName);
        query.addBindValue(nextSignal.sourceSignalName);
        query.addBindValue(nextSignal.targetSignalName);
        query.addBindValue(nextSignal.depth);
        if (!execute(query, "insertNextSignals")) return false;
    }
    return true;
}

// Helper methods
bool DatabaseManager::insertOperationNotificationDisplays(const InterlockingRegistry& registry) {
    QSqlQuery displayQuery(db);
    QSqlQuery stateQuery(db);
    if (!prepare(displayQuery, "INSERT INTO operation_notification_display (name, station_id, is_up, is_down) "
                               "VALUES (?, ?, ?, ?)", "insertOperationNotificationDisplays")
        || !prepare(stateQuery, "INSERT INTO operation_notification_state (display_name, type, content, operated_at) "
                                "VALUES (?, ?, ?, ?)", "insertOperationNotificationDisplays")) {
        return false;
    }

    const QDateTime dayAgo = QDateTime::currentDateTime().addDays(-1);
    for (const OperationNotificationDisplay& display : registry.operationNotificationDisplays().pendingRows()) {
        displayQuery.addBindValue(display.name);
        displayQuery.addBindValue(display.stationId);
        displayQuery.addBindValue(display.isUp);
        displayQuery.addBindValue(display.isDown);
        if (!execute(displayQuery, "insertOperationNotificationDisplays")) return false;

        stateQuery.addBindValue(display.name);
        stateQuery.addBindValue(QString("None"));
        stateQuery.addBindValue(QString(""));
        stateQuery.addBindValue(dayAgo);
        if (!execute(stateQuery, "insertOperationNotificationDisplays")) return false;
    }
    return true;
}

bool DatabaseManager::prepare(QSqlQuery& query, const QString& sql, const QString& operation) {
    if (!query.prepare(sql)) {
        logError(operation, query.lastError());
        setError(QString("Failed to prepare query in %1: %2").arg(operation, query.lastError().text()));
        return false;
    }
    return true;
}

bool DatabaseManager::execute(QSqlQuery& query, const QString& operation) {
    if (!query.exec()) {
        logError(operation, query.lastError());
        setError(QString("%1 failed: %2").arg(operation, query.lastError().text()));
        return false;
    }
    return true;
}

void DatabaseManager::logError(const QString& operation, const QSqlError& error) {
    qWarning() << " [DatabaseManager] Database error in" << operation << ":" << error.text();
}

void DatabaseManager::setError(const QString& error) {
    m_lastError = error;
    emit errorOccurred(error);
}

} // namespace RailSeed
