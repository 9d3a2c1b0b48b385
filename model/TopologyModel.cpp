#include "TopologyModel.h"

namespace RailSeed {

SignalIndication signalIndicationFromText(const QString& text) {
    if (text == "YY") return SignalIndication::YY;
    if (text == "Y") return SignalIndication::Y;
    if (text == "YG") return SignalIndication::YG;
    if (text == "G") return SignalIndication::G;
    return SignalIndication::R;
}

QString signalIndicationName(SignalIndication indication) {
    switch (indication) {
    case SignalIndication::R: return "R";
    case SignalIndication::YY: return "YY";
    case SignalIndication::Y: return "Y";
    case SignalIndication::YG: return "YG";
    case SignalIndication::G: return "G";
    }
    return "R";
}

QString raiseDropName(RaiseDrop value) {
    return value == RaiseDrop::Raise ? "Raise" : "Drop";
}

RaiseDrop raiseDropFromName(const QString& name) {
    return name == "Raise" ? RaiseDrop::Raise : RaiseDrop::Drop;
}

} // namespace RailSeed
