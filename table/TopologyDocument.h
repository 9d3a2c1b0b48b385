#pragma once
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

namespace RailSeed::Table {

struct StationData {
    QString id;
    QString name;
    bool isStation = false;
    bool isPassengerStation = false;
};

struct TrackCircuitData {
    QString name;
    std::optional<int> protectionZone;
    QStringList nextSignalNamesUp;
    QStringList nextSignalNamesDown;
};

struct SignalTypeData {
    QString name;
    QString rIndication;
    QString yyIndication;
    QString yIndication;
    QString ygIndication;
    QString gIndication;
};

struct SignalData {
    QString name;
    QString typeName;
    QStringList nextSignalNames;
    QStringList routeNames;
};

struct ThrowOutControlData {
    QString sourceRouteName;
    QString targetRouteName;
    QString leverConditionName;
};

// The global topology document (DBBase.json).
class TopologyDocument {
public:
    bool loadFromFile(const QString& path);
    bool loadFromJson(const QJsonObject& root);
    QString lastError() const { return m_lastError; }

    const QList<StationData>& stations() const { return m_stations; }
    const QList<TrackCircuitData>& trackCircuits() const { return m_trackCircuits; }
    const QList<SignalTypeData>& signalTypes() const { return m_signalTypes; }
    const QList<SignalData>& signalData() const { return m_signals; }
    const QList<ThrowOutControlData>& throwOutControls() const { return m_throwOutControls; }

private:
    QList<StationData> m_stations;
    QList<TrackCircuitData> m_trackCircuits;
    QList<SignalTypeData> m_signalTypes;
    QList<SignalData> m_signals;
    QList<ThrowOutControlData> m_throwOutControls;
    QString m_lastError;

    static QStringList toStringList(const QJsonValue& value);
};

} // namespace RailSeed::Table
