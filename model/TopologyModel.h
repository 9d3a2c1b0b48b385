#pragma once
#include <QString>

namespace RailSeed {

enum class SignalIndication { R, YY, Y, YG, G };
enum class RaiseDrop { Drop, Raise };

struct Station {
    QString id;
    QString name;
    bool isStation = false;
    bool isPassengerStation = false;
};

// Timer relays of a station; every station gets a 30 s and a 60 s timer.
struct StationTimerState {
    QString stationId;
    int seconds = 0;
    RaiseDrop teuRelay = RaiseDrop::Drop;
    RaiseDrop tenRelay = RaiseDrop::Drop;
    RaiseDrop terRelay = RaiseDrop::Raise;
};

struct SignalType {
    QString name;
    SignalIndication rIndication = SignalIndication::R;
    SignalIndication yyIndication = SignalIndication::R;
    SignalIndication yIndication = SignalIndication::R;
    SignalIndication ygIndication = SignalIndication::R;
    SignalIndication gIndication = SignalIndication::R;
};

struct RouteLeverDestinationButton {
    qulonglong routeId = 0;
    qulonglong leverId = 0;
    QString destinationButtonName;
};

struct SignalRoute {
    QString signalName;
    qulonglong routeId = 0;
};

struct ThrowOutControl {
    qulonglong sourceRouteId = 0;
    qulonglong targetRouteId = 0;
};

struct TrackCircuitSignal {
    qulonglong trackCircuitId = 0;
    QString signalName;
    bool isUp = false;
};

struct RouteLockTrackCircuit {
    qulonglong routeId = 0;
    qulonglong trackCircuitId = 0;
};

struct OperationNotificationDisplay {
    QString name;
    QString stationId;
    bool isUp = false;
    bool isDown = false;
};

// Unknown indication text maps to R.
SignalIndication signalIndicationFromText(const QString& text);
QString signalIndicationName(SignalIndication indication);

QString raiseDropName(RaiseDrop value);
RaiseDrop raiseDropFromName(const QString& name);

} // namespace RailSeed
