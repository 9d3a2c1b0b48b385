#include <gtest/gtest.h>
#include <QSqlQuery>
#include "database/DatabaseInitializer.h"
#include "database/DatabaseManager.h"
#include "TestFixtures.h"

using namespace RailSeed;
using namespace RailSeed::Testing;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!QSqlDatabase::isDriverAvailable("QSQLITE")) {
            GTEST_SKIP() << "QSQLITE driver not available";
        }

        DatabaseSettings settings;
        settings.driver = "QSQLITE";
        settings.databaseName = ":memory:";
        settings.connectionName = uniqueConnectionName();
        ASSERT_TRUE(manager.connectToDatabase(settings)) << manager.lastError().toStdString();

        DatabaseInitializer initializer(manager.getDatabase());
        ASSERT_TRUE(initializer.initializeSchema()) << initializer.lastError().toStdString();
    }

    void TearDown() override {
        manager.cleanup();
    }

    int rowCount(const QString& table) {
        QSqlQuery query(manager.getDatabase());
        if (!query.exec(QString("SELECT COUNT(*) FROM %1").arg(table)) || !query.next()) {
            return -1;
        }
        return query.value(0).toInt();
    }

    // A small registry touching every table
    void populate(InterlockingRegistry& registry) {
        Station station;
        station.id = "TH65";
        station.name = QString::fromUtf8("大道寺");
        station.isStation = true;
        registry.addStation(station);

        SignalType signalType;
        signalType.name = "3YG";
        signalType.gIndication = SignalIndication::G;
        registry.addSignalType(signalType);

        const qulonglong trackCircuit = addTrackCircuit(registry, "TH65_12T");
        const qulonglong machine = addSwitchingMachine(registry, "TH65_W21");
        const qulonglong route = addRoute(registry, "TH65_12R2", "TH65_12");
        const qulonglong target = addRoute(registry, "TH65_13L3", "TH65_13");
        addSignal(registry, QString::fromUtf8("大道寺上り場内1"));
        addSignal(registry, QString::fromUtf8("上り閉塞102"));
        addDirectNextSignal(registry, QString::fromUtf8("大道寺上り場内1"), QString::fromUtf8("上り閉塞102"));

        SignalRoute signalRoute;
        signalRoute.signalName = QString::fromUtf8("大道寺上り場内1");
        signalRoute.routeId = route;
        registry.addSignalRoute(signalRoute);

        ThrowOutControl throwOutControl;
        throwOutControl.sourceRouteId = route;
        throwOutControl.targetRouteId = target;
        registry.addThrowOutControl(throwOutControl);

        TrackCircuitSignal trackCircuitSignal;
        trackCircuitSignal.trackCircuitId = trackCircuit;
        trackCircuitSignal.signalName = QString::fromUtf8("大道寺上り場内1");
        trackCircuitSignal.isUp = true;
        registry.addTrackCircuitSignal(trackCircuitSignal);

        RouteLockTrackCircuit routeLockTrackCircuit;
        routeLockTrackCircuit.routeId = route;
        routeLockTrackCircuit.trackCircuitId = trackCircuit;
        registry.addRouteLockTrackCircuit(routeLockTrackCircuit);

        Lock lock;
        lock.objectId = route;
        lock.type = LockType::RouteLock;
        lock.routeLockGroup = 2;
        const qulonglong lockId = registry.addLock(lock);

        LockCondition condition;
        condition.lockId = lockId;
        condition.type = LockConditionType::Or;
        const qulonglong conditionId = registry.addLockCondition(condition);

        LockConditionObject leaf;
        leaf.lockId = lockId;
        leaf.objectId = machine;
        leaf.parentId = conditionId;
        leaf.timerSeconds = 30;
        leaf.isReverse = ReverseState::Reversed;
        registry.addLockConditionObject(leaf);

        SwitchingMachineRoute switchingMachineRoute;
        switchingMachineRoute.routeId = route;
        switchingMachineRoute.switchingMachineId = machine;
        switchingMachineRoute.isReverse = ReverseState::Reversed;
        registry.addSwitchingMachineRoute(switchingMachineRoute);
    }

    DatabaseManager manager;
};

TEST_F(DatabaseManagerTest, SchemaIsIdempotent) {
    DatabaseInitializer initializer(manager.getDatabase());
    EXPECT_TRUE(initializer.initializeSchema());

    QVariantMap counts = initializer.getTableCounts();
    EXPECT_EQ(counts.size(), DatabaseInitializer::tableNames().size());
    EXPECT_EQ(counts["lock"].toInt(), 0);
}

TEST_F(DatabaseManagerTest, CommitWritesPendingRows) {
    InterlockingRegistry registry;
    populate(registry);
    const int pending = registry.pendingRowCount();

    ASSERT_TRUE(manager.commitRegistry(registry)) << manager.lastError().toStdString();
    EXPECT_EQ(registry.pendingRowCount(), 0);

    EXPECT_EQ(rowCount("station"), 1);
    EXPECT_EQ(rowCount("interlocking_object"), 8);
    EXPECT_EQ(rowCount("\"lock\""), 1);
    EXPECT_EQ(rowCount("next_signal"), 1);
    EXPECT_GT(pending, 0);
}

TEST_F(DatabaseManagerTest, LoadRestoresRegistry) {
    InterlockingRegistry written;
    populate(written);
    ASSERT_TRUE(manager.commitRegistry(written));

    InterlockingRegistry loaded;
    ASSERT_TRUE(manager.loadRegistry(loaded)) << manager.lastError().toStdString();
    EXPECT_EQ(loaded.pendingRowCount(), 0);

    EXPECT_EQ(loaded.objects().size(), written.objects().size());
    const InterlockingObject* route = loaded.findObject("TH65_12R2");
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->id, written.findObject("TH65_12R2")->id);
    EXPECT_EQ(route->type, ObjectType::Route);
    EXPECT_EQ(loaded.routeIdsForLever("TH65_12"), QList<qulonglong>({route->id}));
    EXPECT_TRUE(loaded.hasLocks(route->id));

    ASSERT_EQ(loaded.lockConditionObjects().size(), 1);
    const LockConditionObject& leaf = loaded.lockConditionObjects().rows().first();
    EXPECT_EQ(leaf.timerSeconds.value_or(0), 30);
    EXPECT_EQ(leaf.isReverse, ReverseState::Reversed);
    EXPECT_EQ(leaf.parentId.value_or(0), loaded.lockConditions().rows().first().id);

    ASSERT_EQ(loaded.locks().size(), 1);
    EXPECT_EQ(loaded.locks().rows().first().routeLockGroup, 2);
    EXPECT_EQ(loaded.signalTypes().rows().first().gIndication, SignalIndication::G);
    EXPECT_TRUE(loaded.containsNextSignal(QString::fromUtf8("大道寺上り場内1"), QString::fromUtf8("上り閉塞102")));
}

TEST_F(DatabaseManagerTest, LoadedRegistryContinuesIdSequence) {
    InterlockingRegistry written;
    populate(written);
    ASSERT_TRUE(manager.commitRegistry(written));

    InterlockingRegistry loaded;
    ASSERT_TRUE(manager.loadRegistry(loaded));
    const qulonglong next = addTrackCircuit(loaded, "TH65_13T");
    EXPECT_GT(next, written.findObject(QString::fromUtf8("上り閉塞102"))->id);

    ASSERT_TRUE(manager.commitRegistry(loaded)) << manager.lastError().toStdString();
    EXPECT_EQ(rowCount("interlocking_object"), 9);
}

TEST_F(DatabaseManagerTest, StationIdUpdateIsWritten) {
    InterlockingRegistry registry;
    const qulonglong id = addTrackCircuit(registry, "TH65_12T");
    ASSERT_TRUE(manager.commitRegistry(registry));

    registry.updateObjectStationId(id, "TH65");
    ASSERT_TRUE(manager.commitRegistry(registry));

    QSqlQuery query(manager.getDatabase());
    ASSERT_TRUE(query.exec("SELECT station_id FROM interlocking_object WHERE name = 'TH65_12T'"));
    ASSERT_TRUE(query.next());
    EXPECT_EQ(query.value(0).toString(), "TH65");
}

TEST_F(DatabaseManagerTest, SecondCommitWritesNothing) {
    InterlockingRegistry registry;
    populate(registry);
    ASSERT_TRUE(manager.commitRegistry(registry));
    ASSERT_TRUE(manager.commitRegistry(registry));

    EXPECT_EQ(rowCount("interlocking_object"), 8);
    EXPECT_EQ(rowCount("lock_condition_object"), 1);
}

TEST_F(DatabaseManagerTest, FailedCommitRollsBack) {
    InterlockingRegistry first;
    addTrackCircuit(first, "TH65_12T");
    ASSERT_TRUE(manager.commitRegistry(first));

    // Same id under another name violates the primary key after the station row went in
    InterlockingRegistry clashing;
    Station station;
    station.id = "TH65";
    station.name = QString::fromUtf8("大道寺");
    clashing.addStation(station);
    addTrackCircuit(clashing, "TH65_99T");

    EXPECT_FALSE(manager.commitRegistry(clashing));
    EXPECT_FALSE(manager.lastError().isEmpty());
    EXPECT_EQ(rowCount("station"), 0);
    EXPECT_EQ(rowCount("interlocking_object"), 1);
    EXPECT_GT(clashing.pendingRowCount(), 0);
}

TEST_F(DatabaseManagerTest, NewObjectsGetInitialStates) {
    InterlockingRegistry registry;
    populate(registry);
    ASSERT_TRUE(manager.commitRegistry(registry)) << manager.lastError().toStdString();

    EXPECT_EQ(rowCount("track_circuit_state"), 1);
    EXPECT_EQ(rowCount("switching_machine_state"), 1);
    EXPECT_EQ(rowCount("route_state"), 2);
    EXPECT_EQ(rowCount("lever_state"), 2);
    EXPECT_EQ(rowCount("signal_state"), 2);
    EXPECT_EQ(rowCount("destination_button_state"), 0);

    QSqlQuery query(manager.getDatabase());
    ASSERT_TRUE(query.exec("SELECT is_locked, train_number, is_correction_drop_relay_raised, dropped_at "
                           "FROM track_circuit_state"));
    ASSERT_TRUE(query.next());
    EXPECT_FALSE(query.value(0).toBool());
    EXPECT_EQ(query.value(1).toString(), "");
    EXPECT_EQ(query.value(2).toString(), "Drop");
    EXPECT_TRUE(query.value(3).isNull());

    ASSERT_TRUE(query.exec("SELECT is_reversed FROM lever_state"));
    ASSERT_TRUE(query.next());
    EXPECT_EQ(query.value(0).toString(), "Center");

    ASSERT_TRUE(query.exec("SELECT is_route_lock_raised FROM route_state"));
    ASSERT_TRUE(query.next());
    EXPECT_EQ(query.value(0).toString(), "Drop");

    // Objects added later get their state on the next commit only
    addTrackCircuit(registry, "TH65_13T");
    ASSERT_TRUE(manager.commitRegistry(registry));
    EXPECT_EQ(rowCount("track_circuit_state"), 2);
    EXPECT_EQ(rowCount("route_state"), 2);
}

TEST_F(DatabaseManagerTest, TimerStatesAndDisplaysRoundTrip) {
    InterlockingRegistry written;
    populate(written);

    StationTimerState timerState;
    timerState.stationId = "TH65";
    timerState.seconds = 30;
    ASSERT_TRUE(written.addStationTimerState(timerState));

    OperationNotificationDisplay display;
    display.name = QString::fromUtf8("大道寺上り");
    display.stationId = "TH65";
    display.isUp = true;
    ASSERT_TRUE(written.addOperationNotificationDisplay(display));
    ASSERT_TRUE(written.updateOperationNotificationDisplayName(written.findObject("TH65_12T")->id, display.name));
    ASSERT_TRUE(manager.commitRegistry(written)) << manager.lastError().toStdString();

    EXPECT_EQ(rowCount("operation_notification_state"), 1);
    QSqlQuery query(manager.getDatabase());
    ASSERT_TRUE(query.exec("SELECT type, content FROM operation_notification_state"));
    ASSERT_TRUE(query.next());
    EXPECT_EQ(query.value(0).toString(), "None");
    EXPECT_EQ(query.value(1).toString(), "");

    InterlockingRegistry loaded;
    ASSERT_TRUE(manager.loadRegistry(loaded)) << manager.lastError().toStdString();
    ASSERT_EQ(loaded.stationTimerStates().size(), 1);
    const StationTimerState& loadedTimer = loaded.stationTimerStates().rows().first();
    EXPECT_EQ(loadedTimer.seconds, 30);
    EXPECT_EQ(loadedTimer.teuRelay, RaiseDrop::Drop);
    EXPECT_EQ(loadedTimer.terRelay, RaiseDrop::Raise);

    EXPECT_TRUE(loaded.containsOperationNotificationDisplay(display.name));
    EXPECT_TRUE(loaded.operationNotificationDisplays().rows().first().isUp);
    EXPECT_FALSE(loaded.operationNotificationDisplays().rows().first().isDown);
    EXPECT_EQ(loaded.findObject("TH65_12T")->operationNotificationDisplayName, display.name);
    EXPECT_EQ(loaded.pendingRowCount(), 0);
}

TEST_F(DatabaseManagerTest, DisplayNameUpdateIsWritten) {
    InterlockingRegistry registry;
    const qulonglong id = addTrackCircuit(registry, "TH65_12T");
    ASSERT_TRUE(manager.commitRegistry(registry));

    ASSERT_TRUE(registry.updateOperationNotificationDisplayName(id, QString::fromUtf8("大道寺上り")));
    EXPECT_EQ(registry.pendingRowCount(), 1);
    ASSERT_TRUE(manager.commitRegistry(registry));

    QSqlQuery query(manager.getDatabase());
    ASSERT_TRUE(query.exec("SELECT operation_notification_display_name FROM interlocking_object"));
    ASSERT_TRUE(query.next());
    EXPECT_EQ(query.value(0).toString(), QString::fromUtf8("大道寺上り"));
    EXPECT_EQ(rowCount("track_circuit_state"), 1);
}

TEST(DatabaseManagerConnectionTest, UnknownDriverFails) {
    DatabaseManager manager;
    DatabaseSettings settings;
    settings.driver = "QNOSUCHDRIVER";
    settings.connectionName = uniqueConnectionName();

    EXPECT_FALSE(manager.connectToDatabase(settings));
    EXPECT_FALSE(manager.isConnected());
    EXPECT_FALSE(manager.lastError().isEmpty());
}

TEST(DatabaseManagerConnectionTest, RegistryCallsNeedConnection) {
    DatabaseManager manager;
    InterlockingRegistry registry;
    EXPECT_FALSE(manager.loadRegistry(registry));
    EXPECT_FALSE(manager.commitRegistry(registry));
}
