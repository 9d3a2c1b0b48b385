#include "DatabaseInitializer.h"

namespace RailSeed {

DatabaseInitializer::DatabaseInitializer(const QSqlDatabase& database, QObject* parent)
    : QObject(parent)
    , db(database)
{
}

QStringList DatabaseInitializer::tableNames() {
    return {
        "station", "signal_type", "interlocking_object", "route_lever_destination_button",
        "\"lock\"", "lock_condition", "lock_condition_object", "switching_machine_route",
        "next_signal", "track_circuit_signal", "signal_route", "throw_out_control",
        "route_lock_track_circuit", "station_timer_state", "operation_notification_display",
        "operation_notification_state", "track_circuit_state", "signal_state", "switching_machine_state",
        "lever_state", "destination_button_state", "route_state"
    };
}

bool DatabaseInitializer::initializeSchema() {
    if (!db.isOpen()) {
        setError("Database is not open");
        return false;
    }

    m_lastError.clear();
    qDebug() << " [DatabaseInitializer] Creating interlocking schema on" << db.driverName();

    emit currentOperationChanged("Creating topology tables");
    if (!createTopologyTables()) return false;

    emit currentOperationChanged("Creating object tables");
    if (!createObjectTables()) return false;

    emit currentOperationChanged("Creating lock tables");
    if (!createLockTables()) return false;

    emit currentOperationChanged("Creating signal tables");
    if (!createSignalTables()) return false;

    emit currentOperationChanged("Creating state tables");
    if (!createStateTables()) return false;

    emit currentOperationChanged("Creating indexes");
    if (!createIndexes()) return false;

    return validateDatabase();
}

bool DatabaseInitializer::createTopologyTables() {
    QStringList topologyTables = {
        R"(CREATE TABLE IF NOT EXISTS station (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            is_station BOOLEAN NOT NULL DEFAULT FALSE,
            is_passenger_station BOOLEAN NOT NULL DEFAULT FALSE
        ))",

        // Indications are stored by name: R, YY, Y, YG, G
        R"(CREATE TABLE IF NOT EXISTS signal_type (
            name TEXT PRIMARY KEY,
            r_indication TEXT NOT NULL,
            yy_indication TEXT NOT NULL,
            y_indication TEXT NOT NULL,
            yg_indication TEXT NOT NULL,
            g_indication TEXT NOT NULL
        ))",

        // Relays are stored as Raise or Drop
        R"(CREATE TABLE IF NOT EXISTS station_timer_state (
            station_id TEXT NOT NULL,
            seconds INTEGER NOT NULL,
            is_teu_relay_raised TEXT NOT NULL,
            is_ten_relay_raised TEXT NOT NULL,
            is_ter_relay_raised TEXT NOT NULL,
            PRIMARY KEY (station_id, seconds)
        ))",

        R"(CREATE TABLE IF NOT EXISTS operation_notification_display (
            name TEXT PRIMARY KEY,
            station_id TEXT NOT NULL,
            is_up BOOLEAN NOT NULL,
            is_down BOOLEAN NOT NULL
        ))"
    };

    for (const QString& query : topologyTables) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::createObjectTables() {
    QStringList objectTables = {
        // One table for every object type; columns of other types stay NULL
        R"(CREATE TABLE IF NOT EXISTS interlocking_object (
            id BIGINT PRIMARY KEY,
            type TEXT NOT NULL,
            name TEXT NOT NULL UNIQUE,
            station_id TEXT,
            tc_name TEXT,
            route_type TEXT,
            indicator TEXT,
            approach_lock_time INTEGER,
            lever_type TEXT,
            switching_machine_id BIGINT,
            protection_zone INTEGER,
            signal_type_name TEXT,
            track_circuit_id BIGINT,
            operation_notification_display_name TEXT
        ))",

        R"(CREATE TABLE IF NOT EXISTS route_lever_destination_button (
            route_id BIGINT PRIMARY KEY,
            lever_id BIGINT NOT NULL,
            destination_button_name TEXT NOT NULL
        ))",

        R"(CREATE TABLE IF NOT EXISTS route_lock_track_circuit (
            route_id BIGINT NOT NULL,
            track_circuit_id BIGINT NOT NULL,
            PRIMARY KEY (route_id, track_circuit_id)
        ))",

        R"(CREATE TABLE IF NOT EXISTS throw_out_control (
            source_route_id BIGINT NOT NULL,
            target_route_id BIGINT NOT NULL,
            PRIMARY KEY (source_route_id, target_route_id)
        ))"
    };

    for (const QString& query : objectTables) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::createLockTables() {
    QStringList lockTables = {
        R"(CREATE TABLE IF NOT EXISTS "lock" (
            id BIGINT PRIMARY KEY,
            object_id BIGINT NOT NULL,
            type TEXT NOT NULL,
            route_lock_group INTEGER NOT NULL
        ))",

        R"(CREATE TABLE IF NOT EXISTS lock_condition (
            id BIGINT PRIMARY KEY,
            lock_id BIGINT NOT NULL,
            type TEXT NOT NULL,
            parent_id BIGINT
        ))",

        R"(CREATE TABLE IF NOT EXISTS lock_condition_object (
            id BIGINT PRIMARY KEY,
            lock_id BIGINT NOT NULL,
            object_id BIGINT NOT NULL,
            parent_id BIGINT,
            timer_seconds INTEGER,
            is_reverse BOOLEAN NOT NULL DEFAULT FALSE
        ))",

        R"(CREATE TABLE IF NOT EXISTS switching_machine_route (
            route_id BIGINT NOT NULL,
            switching_machine_id BIGINT NOT NULL,
            is_reverse BOOLEAN NOT NULL DEFAULT FALSE
        ))"
    };

    for (const QString& query : lockTables) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::createSignalTables() {
    QStringList signalTables = {
        R"(CREATE TABLE IF NOT EXISTS next_signal (
            signal_name TEXT NOT NULL,
            source_signal_name TEXT NOT NULL,
            target_signal_name TEXT NOT NULL,
            depth INTEGER NOT NULL,
            PRIMARY KEY (signal_name, target_signal_name)
        ))",

        R"(CREATE TABLE IF NOT EXISTS track_circuit_signal (
            track_circuit_id BIGINT NOT NULL,
            signal_name TEXT NOT NULL,
            is_up BOOLEAN NOT NULL,
            PRIMARY KEY (track_circuit_id, signal_name, is_up)
        ))",

        R"(CREATE TABLE IF NOT EXISTS signal_route (
            signal_name TEXT NOT NULL,
            route_id BIGINT NOT NULL,
            PRIMARY KEY (signal_name, route_id)
        ))"
    };

    for (const QString& query : signalTables) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::createStateTables() {
    QStringList stateTables = {
        R"(CREATE TABLE IF NOT EXISTS operation_notification_state (
            display_name TEXT PRIMARY KEY,
            type TEXT NOT NULL,
            content TEXT NOT NULL,
            operated_at TIMESTAMP NOT NULL
        ))",

        // Object states share the id of their interlocking_object row
        R"(CREATE TABLE IF NOT EXISTS track_circuit_state (
            id BIGINT PRIMARY KEY,
            is_short_circuit BOOLEAN NOT NULL,
            is_locked BOOLEAN NOT NULL,
            train_number TEXT NOT NULL,
            is_correction_drop_relay_raised TEXT NOT NULL,
            is_correction_raise_relay_raised TEXT NOT NULL,
            dropped_at TIMESTAMP,
            raised_at TIMESTAMP
        ))",

        R"(CREATE TABLE IF NOT EXISTS signal_state (
            id BIGINT PRIMARY KEY,
            is_lighted BOOLEAN NOT NULL
        ))",

        R"(CREATE TABLE IF NOT EXISTS switching_machine_state (
            id BIGINT PRIMARY KEY,
            is_switching BOOLEAN NOT NULL,
            is_reverse BOOLEAN NOT NULL,
            switch_end_time TIMESTAMP NOT NULL
        ))",

        // Left, Center or Right
        R"(CREATE TABLE IF NOT EXISTS lever_state (
            id BIGINT PRIMARY KEY,
            is_reversed TEXT NOT NULL
        ))",

        R"(CREATE TABLE IF NOT EXISTS destination_button_state (
            id BIGINT PRIMARY KEY,
            is_raised TEXT NOT NULL,
            operated_at TIMESTAMP NOT NULL
        ))",

        R"(CREATE TABLE IF NOT EXISTS route_state (
            id BIGINT PRIMARY KEY,
            is_lever_relay_raised TEXT NOT NULL,
            is_route_relay_raised TEXT NOT NULL,
            is_signal_control_raised TEXT NOT NULL,
            is_approach_lock_mr_raised TEXT NOT NULL,
            is_approach_lock_ms_raised TEXT NOT NULL,
            is_route_lock_raised TEXT NOT NULL
        ))"
    };

    for (const QString& query : stateTables) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::createIndexes() {
    QStringList indexes = {
        "CREATE INDEX IF NOT EXISTS idx_lock_object ON \"lock\"(object_id)",
        "CREATE INDEX IF NOT EXISTS idx_lock_condition_lock ON lock_condition(lock_id)",
        "CREATE INDEX IF NOT EXISTS idx_lock_condition_object_lock ON lock_condition_object(lock_id)",
        "CREATE INDEX IF NOT EXISTS idx_switching_machine_route_route ON switching_machine_route(route_id)",
        "CREATE INDEX IF NOT EXISTS idx_interlocking_object_station ON interlocking_object(station_id)"
    };

    for (const QString& query : indexes) {
        if (!executeQuery(query)) return false;
    }
    return true;
}

bool DatabaseInitializer::validateDatabase() {
    for (const QString& table : tableNames()) {
        QSqlQuery validationQuery(db);
        if (!validationQuery.exec(QString("SELECT COUNT(*) FROM %1").arg(table))) {
            setError(QString("Validation failed for table %1: %2").arg(table, validationQuery.lastError().text()));
            return false;
        }
    }

    qDebug() << " [DatabaseInitializer] Schema validated," << tableNames().size() << "tables";
    return true;
}

QVariantMap DatabaseInitializer::getTableCounts() {
    QVariantMap counts;
    for (const QString& table : tableNames()) {
        QSqlQuery countQuery(db);
        if (countQuery.exec(QString("SELECT COUNT(*) FROM %1").arg(table)) && countQuery.next()) {
            QString key = table;
            key.remove('"');
            counts[key] = countQuery.value(0).toInt();
        } else {
            qWarning() << " [DatabaseInitializer] Cannot count" << table << ":" << countQuery.lastError().text();
        }
    }
    return counts;
}

// Helper methods
bool DatabaseInitializer::executeQuery(const QString& query) {
    // Not prepared: PostgreSQL cannot prepare DDL
    QSqlQuery sqlQuery(db);
    if (!sqlQuery.exec(query)) {
        setError(QString("Query execution failed: %1 - Error: %2")
                     .arg(query.simplified().left(60)).arg(sqlQuery.lastError().text()));
        return false;
    }
    return true;
}

void DatabaseInitializer::setError(const QString& error) {
    m_lastError = error;
    emit lastErrorChanged();
    qWarning() << " [DatabaseInitializer] Error:" << error;
}

} // namespace RailSeed
