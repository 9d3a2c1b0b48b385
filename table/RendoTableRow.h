#pragma once
#include <QList>
#include <QString>
#include <QStringList>

namespace RailSeed::Table {

// One row of a station interlocking table, columns in file order.
struct RendoTableRow {
    QString name;
    QString start;
    QString end;
    QString indicator;
    QString approachTime;
    QString approachLock;
    QString lockToSwitchingMachine;
    QString lockToRoute;
    QString signalControl;
    QString routeLock;

    static constexpr int COLUMN_COUNT = 10;
    static RendoTableRow fromFields(const QStringList& fields);
};

using RendoTable = QList<RendoTableRow>;

} // namespace RailSeed::Table
