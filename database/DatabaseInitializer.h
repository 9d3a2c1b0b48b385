#pragma once
#include <QObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QVariantMap>
#include <QDebug>

namespace RailSeed {

// Creates the interlocking tables when they are missing. Existing tables and
// rows are left alone, so initializing a populated database is a no-op.
class DatabaseInitializer : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    explicit DatabaseInitializer(const QSqlDatabase& database, QObject* parent = nullptr);

    QString lastError() const { return m_lastError; }

    bool initializeSchema();
    bool validateDatabase();
    QVariantMap getTableCounts();

    static QStringList tableNames();

signals:
    void lastErrorChanged();
    void currentOperationChanged(const QString& operation);

private:
    QSqlDatabase db;
    QString m_lastError;

    bool createTopologyTables();
    bool createObjectTables();
    bool createLockTables();
    bool createSignalTables();
    bool createStateTables();
    bool createIndexes();

    bool executeQuery(const QString& query);
    void setError(const QString& error);
};

} // namespace RailSeed
