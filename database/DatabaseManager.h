#pragma once
#include <QObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QVariantMap>
#include <QDebug>
#include "../config/CompilerConfig.h"
#include "../model/InterlockingRegistry.h"

namespace RailSeed {

// Owns the Qt SQL connection and moves registry rows in and out of it.
// commitRegistry() writes every pending row inside one transaction.
class DatabaseManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool isConnected READ isConnected NOTIFY connectionStateChanged)

public:
    explicit DatabaseManager(QObject* parent = nullptr);
    ~DatabaseManager();

    QSqlDatabase getDatabase() const;

    // Connection management
    bool connectToDatabase(const DatabaseSettings& settings);
    bool isConnected() const { return connected; }
    void cleanup();
    QString lastError() const { return m_lastError; }

    // === REGISTRY PERSISTENCE ===
    bool loadRegistry(InterlockingRegistry& registry);
    bool commitRegistry(InterlockingRegistry& registry);

signals:
    void connectionStateChanged(bool connected);
    void errorOccurred(const QString& error);
    void registryCommitted(int rowCount);

private:
    QSqlDatabase db;
    bool connected = false;
    QString m_connectionName;
    QString m_lastError;

    // Loading, in dependency order
    bool loadStations(InterlockingRegistry& registry);
    bool loadStationTimerStates(InterlockingRegistry& registry);
    bool loadSignalTypes(InterlockingRegistry& registry);
    bool loadObjects(InterlockingRegistry& registry);
    bool loadAssociations(InterlockingRegistry& registry);
    bool loadLockGraph(InterlockingRegistry& registry);
    bool loadNextSignals(InterlockingRegistry& registry);
    bool loadOperationNotificationDisplays(InterlockingRegistry& registry);

    // Writing; each returns false on the first failed row
    bool insertStations(const InterlockingRegistry& registry);
    bool insertStationTimerStates(const InterlockingRegistry& registry);
    bool insertSignalTypes(const InterlockingRegistry& registry);
    bool insertObjects(const InterlockingRegistry& registry);
    // Initial state row per new object, keyed by the object id
    bool insertObjectStates(const InterlockingRegistry& registry);
    bool updateModifiedObjects(const InterlockingRegistry& registry);
    bool insertAssociations(const InterlockingRegistry& registry);
    bool insertLockGraph(const InterlockingRegistry& registry);
    bool insertNextSignals(const InterlockingRegistry& registry);
    bool insertOperationNotificationDisplays(const InterlockingRegistry& registry);

    bool prepare(QSqlQuery& query, const QString& sql, const QString& operation);
    bool execute(QSqlQuery& query, const QString& operation);
    void logError(const QString& operation, const QSqlError& error);
    void setError(const QString& error);
};

} // namespace RailSeed
