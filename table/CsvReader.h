#pragma once
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>
#include "RendoTableRow.h"

namespace RailSeed::Table {

class CsvReader {
public:
    // Quoted fields may contain separators, doubled quotes and line breaks.
    static QList<QStringList> parse(const QString& text);
    // true/false, 1/0, yes/no in any case; a blank field is false
    static std::optional<bool> parseBool(const QString& field);

    bool readFile(const QString& path, bool skipHeader = true);
    const QList<QStringList>& records() const { return m_records; }
    QString lastError() const { return m_lastError; }

    RendoTable toRendoTable() const;

private:
    QList<QStringList> m_records;
    QString m_lastError;
};

} // namespace RailSeed::Table
