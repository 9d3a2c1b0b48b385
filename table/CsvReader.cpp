#include "CsvReader.h"
#include <QFile>
#include <QTextStream>
#include <QDebug>

namespace RailSeed::Table {

RendoTableRow RendoTableRow::fromFields(const QStringList& fields) {
    RendoTableRow row;
    QString* columns[COLUMN_COUNT] = {
        &row.name, &row.start, &row.end, &row.indicator, &row.approachTime,
        &row.approachLock, &row.lockToSwitchingMachine, &row.lockToRoute,
        &row.signalControl, &row.routeLock
    };
    for (int i = 0; i < COLUMN_COUNT && i < fields.size(); ++i) {
        *columns[i] = fields.at(i).trimmed();
    }
    return row;
}

QList<QStringList> CsvReader::parse(const QString& text) {
    QList<QStringList> records;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto finishRecord = [&]() {
        fields.append(field);
        // Blank lines carry no record
        if (!(fields.size() == 1 && fields.first().isEmpty() && !fieldStarted)) {
            records.append(fields);
        }
        fields.clear();
        field.clear();
        fieldStarted = false;
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text.at(i + 1) == '"') {
                    field.append('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.append(c);
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == ',') {
            fields.append(field);
            field.clear();
            fieldStarted = true;
        } else if (c == '\r') {
            continue;
        } else if (c == '\n') {
            finishRecord();
        } else {
            field.append(c);
            fieldStarted = true;
        }
    }

    if (fieldStarted || !field.isEmpty() || !fields.isEmpty()) {
        finishRecord();
    }

    return records;
}

bool CsvReader::readFile(const QString& path, bool skipHeader) {
    m_records.clear();
    m_lastError.clear();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_lastError = QString("Cannot open CSV file: %1").arg(path);
        qWarning() << " [CsvReader]" << m_lastError;
        return false;
    }

    QTextStream stream(&file);
    stream.setEncoding(QStringConverter::Utf8);
    QString text = stream.readAll();
    if (text.startsWith(QChar(0xFEFF))) {
        text.remove(0, 1);
    }

    m_records = parse(text);
    if (skipHeader && !m_records.isEmpty()) {
        m_records.removeFirst();
    }

    qDebug() << " [CsvReader] Read" << m_records.size() << "records from" << path;
    return true;
}

std::optional<bool> CsvReader::parseBool(const QString& field) {
    const QString value = field.trimmed().toLower();
    if (value.isEmpty() || value == "false" || value == "0" || value == "no") {
        return false;
    }
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    return std::nullopt;
}

RendoTable CsvReader::toRendoTable() const {
    RendoTable table;
    table.reserve(m_records.size());
    for (const QStringList& record : m_records) {
        table.append(RendoTableRow::fromFields(record));
    }
    return table;
}

} // namespace RailSeed::Table
