#pragma once
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace RailSeed {

struct DatabaseSettings {
    QString driver = "QPSQL";
    QString hostName = "localhost";
    int port = 5432;
    QString databaseName = "multiats_interlocking";
    QString userName = "postgres";
    QString password;
    QString connectionName = "railseed_connection";
};

class CompilerConfig {
public:
    CompilerConfig();

    // Overlays values from a JSON file on top of the current settings.
    bool loadFromFile(const QString& path);
    bool loadFromJson(const QJsonObject& root);
    QString lastError() const { return m_lastError; }

    // Data sources
    QString dataDirectory() const { return m_dataDirectory; }
    void setDataDirectory(const QString& directory) { m_dataDirectory = directory; }
    QString topologyFilePath() const;
    QString rendoTableDirectory() const;
    QString routeTrackCircuitFilePath() const;
    QString operationNotificationDisplayFilePath() const;

    DatabaseSettings& database() { return m_database; }
    const DatabaseSettings& database() const { return m_database; }

    // Station adjacency consulted by [ ] / [[ ]] references
    QStringList adjacentStations(const QString& stationId) const { return m_stationAdjacency.value(stationId); }
    void setAdjacentStations(const QString& stationId, const QStringList& stations);

    // Known table exceptions
    bool isDirectionalLever(const QString& stationId, const QString& token) const;
    bool isApproachLockExempt(const QString& stationId, const QString& leverStart) const;
    QString detectorCutoffLever(const QString& stationId) const { return m_detectorCutoffLevers.value(stationId); }

private:
    QString m_dataDirectory = "./Data";
    DatabaseSettings m_database;
    QHash<QString, QStringList> m_stationAdjacency;
    QHash<QString, QStringList> m_directionalLeverPrefixes;
    QHash<QString, QStringList> m_approachLockExemptLevers;
    QHash<QString, QString> m_detectorCutoffLevers;
    QString m_lastError;

    static QHash<QString, QStringList> parseStringListMap(const QJsonObject& object);
};

} // namespace RailSeed
