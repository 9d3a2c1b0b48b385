#include "RowPreprocessor.h"

namespace RailSeed::Table {

bool RowPreprocessor::isDittoMark(const QString& value) {
    // 同上, 同左 ...
    return value.startsWith(QChar(0x540C));
}

void RowPreprocessor::normalize(RendoTable& rows) {
    QString previousName;
    QString previousStart;
    QString previousApproachTime;
    QString previousApproachLock;

    for (RendoTableRow& row : rows) {
        if (row.name.trimmed().isEmpty() || isDittoMark(row.name)) {
            row.name = previousName;
        } else {
            previousName = row.name;
        }

        if (row.start.trimmed().isEmpty()) {
            row.start = previousStart;
        }

        // A lever's approach lock is written once, on its first row
        if (previousStart != row.start) {
            previousApproachTime = row.approachTime;
            previousApproachLock = row.approachLock;
        } else {
            row.approachTime = previousApproachTime;
            row.approachLock = previousApproachLock;
        }

        previousStart = row.start;
    }
}

} // namespace RailSeed::Table
