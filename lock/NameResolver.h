#pragma once
#include <QList>
#include <QString>
#include "LockItem.h"
#include "../compiler/CompileResult.h"
#include "../config/CompilerConfig.h"
#include "../model/InterlockingRegistry.h"

namespace RailSeed::Locking {

enum class ResolveStrategy {
    SwitchingMachine,   // <station>_W<token>
    General,            // <station>_<token>, then multi-route lever expansion
    ApproachLock        // general, then closure / literal track circuit names
};

// OK with objects, SKIPPED for the documented table exceptions, or fatal.
struct Resolution {
    QList<const InterlockingObject*> objects;
    CompileResult result;
};

class NameResolver {
public:
    NameResolver(const InterlockingRegistry& registry, const CompilerConfig& config);

    Resolution resolve(const LockItem& item, ResolveStrategy strategy) const;

private:
    QList<const InterlockingObject*> searchSwitchingMachine(const LockItem& item) const;
    QList<const InterlockingObject*> searchGeneral(const LockItem& item) const;
    QList<const InterlockingObject*> searchApproachLock(const LockItem& item, CompileResult& error) const;

    // Empty for tokens that are not block numbers; ok is false when the number does not fit an int
    static QString closureTrackCircuitName(const QString& token, bool* ok);

    const InterlockingRegistry& m_registry;
    const CompilerConfig& m_config;
};

} // namespace RailSeed::Locking
