#include "ObjectNames.h"
#include <QRegularExpression>

namespace RailSeed::ObjectNames {

QString objectName(const QString& stationId, const QString& localName) {
    return QString("%1_%2").arg(stationId, localName);
}

QString switchingMachineName(const QString& stationId, const QString& start) {
    return objectName(stationId, "W" + start);
}

QString leverName(const QString& stationId, const QString& start) {
    QString local = start;
    local.remove('R').remove('L');
    return objectName(stationId, local);
}

QString destinationButtonName(const QString& stationId, const QString& end) {
    QString local = end;
    local.remove('(').remove(')');
    return objectName(stationId, local + "P");
}

QString routeName(const QString& stationId, const QString& start, const QString& end) {
    // A parenthesised end is a direction note, not a destination
    return objectName(stationId, start + (end.startsWith('(') ? QString() : end));
}

QString toFullWidth(const QString& text) {
    QString result = text;
    result.replace(QChar(0xFF72), QChar(0x30A4));
    result.replace(QChar(0xFF9B), QChar(0x30ED));
    return result;
}

QString stationIdFromName(const QString& name) {
    static const QRegularExpression pattern(QStringLiteral("^(TH\\d{1,2}S?)_"));
    QRegularExpressionMatch match = pattern.match(name);
    return match.hasMatch() ? match.captured(1) : QString();
}

} // namespace RailSeed::ObjectNames
