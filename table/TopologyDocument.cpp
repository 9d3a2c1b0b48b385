#include "TopologyDocument.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

namespace RailSeed::Table {

bool TopologyDocument::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Cannot open topology document: %1").arg(path);
        qCritical() << " [TopologyDocument]" << m_lastError;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        m_lastError = QString("Invalid JSON in topology document: %1").arg(parseError.errorString());
        qCritical() << " [TopologyDocument]" << m_lastError;
        return false;
    }

    if (!doc.isObject()) {
        m_lastError = QString("Topology document root must be an object: %1").arg(path);
        qCritical() << " [TopologyDocument]" << m_lastError;
        return false;
    }

    return loadFromJson(doc.object());
}

bool TopologyDocument::loadFromJson(const QJsonObject& root) {
    m_stations.clear();
    m_trackCircuits.clear();
    m_signalTypes.clear();
    m_signals.clear();
    m_throwOutControls.clear();

    for (const QJsonValue& value : root["stationList"].toArray()) {
        QJsonObject object = value.toObject();
        StationData station;
        station.id = object["Id"].toString();
        station.name = object["Name"].toString();
        station.isStation = object["IsStation"].toBool(false);
        station.isPassengerStation = object["IsPassengerStation"].toBool(false);
        m_stations.append(station);
    }

    for (const QJsonValue& value : root["trackCircuitList"].toArray()) {
        QJsonObject object = value.toObject();
        TrackCircuitData trackCircuit;
        trackCircuit.name = object["Name"].toString();
        if (object["ProtectionZone"].isDouble()) {
            trackCircuit.protectionZone = object["ProtectionZone"].toInt();
        }
        trackCircuit.nextSignalNamesUp = toStringList(object["NextSignalNamesUp"]);
        trackCircuit.nextSignalNamesDown = toStringList(object["NextSignalNamesDown"]);
        m_trackCircuits.append(trackCircuit);
    }

    for (const QJsonValue& value : root["signalTypeList"].toArray()) {
        QJsonObject object = value.toObject();
        SignalTypeData signalType;
        signalType.name = object["Name"].toString();
        signalType.rIndication = object["RIndication"].toString();
        signalType.yyIndication = object["YYIndication"].toString();
        signalType.yIndication = object["YIndication"].toString();
        signalType.ygIndication = object["YGIndication"].toString();
        signalType.gIndication = object["GIndication"].toString();
        m_signalTypes.append(signalType);
    }

    for (const QJsonValue& value : root["signalDataList"].toArray()) {
        QJsonObject object = value.toObject();
        SignalData signal;
        signal.name = object["Name"].toString();
        signal.typeName = object["TypeName"].toString();
        signal.nextSignalNames = toStringList(object["NextSignalNames"]);
        signal.routeNames = toStringList(object["RouteNames"]);
        m_signals.append(signal);
    }

    for (const QJsonValue& value : root["throwOutControlList"].toArray()) {
        QJsonObject object = value.toObject();
        ThrowOutControlData throwOutControl;
        throwOutControl.sourceRouteName = object["SourceRouteName"].toString();
        throwOutControl.targetRouteName = object["TargetRouteName"].toString();
        throwOutControl.leverConditionName = object["LeverConditionName"].toString();
        m_throwOutControls.append(throwOutControl);
    }

    qDebug() << " [TopologyDocument] Loaded" << m_stations.size() << "stations,"
             << m_trackCircuits.size() << "track circuits," << m_signals.size() << "signals,"
             << m_throwOutControls.size() << "throw-out controls";
    return true;
}

QStringList TopologyDocument::toStringList(const QJsonValue& value) {
    QStringList result;
    for (const QJsonValue& item : value.toArray()) {
        result.append(item.toString());
    }
    return result;
}

} // namespace RailSeed::Table
