#pragma once
#include <QVariantMap>
#include "CompileResult.h"
#include "../model/InterlockingRegistry.h"
#include "../table/TopologyDocument.h"

namespace RailSeed {

// Seeds the registry from the topology document. seed() runs before any
// station table; seedPostAssociations() runs once every route exists.
class TopologySeeder {
public:
    TopologySeeder(InterlockingRegistry& registry, const Table::TopologyDocument& document);

    CompileResult seed();
    CompileResult seedPostAssociations();

    QVariantMap statistics() const { return m_statistics; }

private:
    // === OBJECTS ===
    void seedStations();
    void seedStationTimerStates();
    void seedTrackCircuits();
    void seedSignalTypes();
    void seedSignals();
    void seedDirectNextSignals();
    void seedTrackCircuitSignals();

    // === POST ASSOCIATIONS ===
    void seedSignalRoutes();
    CompileResult seedThrowOutControls();
    void backfillStationIds();

    QString stationIdForSignal(const QString& signalName) const;
    const InterlockingObject* findRoute(const QString& name) const;
    void count(const QString& key, int added);

    InterlockingRegistry& m_registry;
    const Table::TopologyDocument& m_document;
    QVariantMap m_statistics;
};

} // namespace RailSeed
