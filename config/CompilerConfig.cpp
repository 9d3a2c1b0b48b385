#include "CompilerConfig.h"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

namespace RailSeed {

CompilerConfig::CompilerConfig() {
    // Hand-maintained neighbours: index 0 is reached with [ ], index 1 with [[ ]]
    m_stationAdjacency = {
        {"TH65", {"TH66S", "TH64"}},   // 大道寺: 江ノ原検車区, 藤江
        {"TH66S", {"TH65"}},           // 江ノ原検車区: 大道寺
        {"TH67", {}},                  // 新野崎
        {"TH70", {"TH71"}},            // 浜園: 津崎
        {"TH71", {"TH70"}},            // 津崎: 浜園
        {"TH75", {"TH76"}},            // 駒野: 館浜
        {"TH76", {"TH75"}},            // 館浜: 駒野
    };

    // 大道寺14L/R are directional levers, not routes
    m_directionalLeverPrefixes = {{"TH65", {"14"}}};
    // 大道寺13L routes lead onto the mountain line; their approach lock column does not parse
    m_approachLockExemptLevers = {{"TH65", {"13L"}}};
    // 江ノ原 61-78 switching machines are not modelled by the simulator
    m_detectorCutoffLevers = {{"TH66S", "61"}};
}

QString CompilerConfig::topologyFilePath() const {
    return QDir(m_dataDirectory).filePath("DBBase.json");
}

QString CompilerConfig::rendoTableDirectory() const {
    return QDir(m_dataDirectory).filePath("RendoTable");
}

QString CompilerConfig::routeTrackCircuitFilePath() const {
    return QDir(m_dataDirectory).filePath(QString::fromUtf8("進路.csv"));
}

QString CompilerConfig::operationNotificationDisplayFilePath() const {
    return QDir(m_dataDirectory).filePath(QString::fromUtf8("運転告知器.csv"));
}

void CompilerConfig::setAdjacentStations(const QString& stationId, const QStringList& stations) {
    m_stationAdjacency[stationId] = stations;
}

bool CompilerConfig::isDirectionalLever(const QString& stationId, const QString& token) const {
    for (const QString& prefix : m_directionalLeverPrefixes.value(stationId)) {
        if (token.startsWith(prefix)) {
            return true;
        }
    }
    return false;
}

bool CompilerConfig::isApproachLockExempt(const QString& stationId, const QString& leverStart) const {
    return m_approachLockExemptLevers.value(stationId).contains(leverStart);
}

bool CompilerConfig::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Cannot open configuration file: %1").arg(path);
        qCritical() << " [CompilerConfig]" << m_lastError;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        m_lastError = QString("Invalid JSON in configuration %1: %2").arg(path, parseError.errorString());
        qCritical() << " [CompilerConfig]" << m_lastError;
        return false;
    }

    if (!doc.isObject()) {
        m_lastError = QString("Configuration root must be an object: %1").arg(path);
        qCritical() << " [CompilerConfig]" << m_lastError;
        return false;
    }

    return loadFromJson(doc.object());
}

bool CompilerConfig::loadFromJson(const QJsonObject& root) {
    if (root.contains("data_directory")) {
        m_dataDirectory = root["data_directory"].toString(m_dataDirectory);
    }

    if (root.contains("database")) {
        QJsonObject databaseObject = root["database"].toObject();
        m_database.driver = databaseObject["driver"].toString(m_database.driver);
        m_database.hostName = databaseObject["host"].toString(m_database.hostName);
        m_database.port = databaseObject["port"].toInt(m_database.port);
        m_database.databaseName = databaseObject["name"].toString(m_database.databaseName);
        m_database.userName = databaseObject["user"].toString(m_database.userName);
        m_database.password = databaseObject["password"].toString(m_database.password);
    }

    if (root.contains("station_adjacency")) {
        // Replaces the built-in table entirely
        m_stationAdjacency = parseStringListMap(root["station_adjacency"].toObject());
    }

    if (root.contains("directional_levers")) {
        m_directionalLeverPrefixes = parseStringListMap(root["directional_levers"].toObject());
    }

    if (root.contains("approach_lock_exempt_levers")) {
        m_approachLockExemptLevers = parseStringListMap(root["approach_lock_exempt_levers"].toObject());
    }

    if (root.contains("detector_cutoff_levers")) {
        m_detectorCutoffLevers.clear();
        QJsonObject cutoffObject = root["detector_cutoff_levers"].toObject();
        for (auto it = cutoffObject.begin(); it != cutoffObject.end(); ++it) {
            m_detectorCutoffLevers.insert(it.key(), it.value().toString());
        }
    }

    qDebug() << " [CompilerConfig] Loaded configuration:" << m_stationAdjacency.size() << "stations with adjacency,"
             << "driver" << m_database.driver;
    return true;
}

QHash<QString, QStringList> CompilerConfig::parseStringListMap(const QJsonObject& object) {
    QHash<QString, QStringList> result;
    for (auto it = object.begin(); it != object.end(); ++it) {
        QStringList values;
        for (const QJsonValue& value : it.value().toArray()) {
            values.append(value.toString());
        }
        result.insert(it.key(), values);
    }
    return result;
}

} // namespace RailSeed
