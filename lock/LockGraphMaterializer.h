#pragma once
#include <QList>
#include <optional>
#include "LockItem.h"
#include "NameResolver.h"
#include "../compiler/CompileResult.h"
#include "../model/InterlockingRegistry.h"

namespace RailSeed::Locking {

struct MaterializeRequest {
    qulonglong objectId = 0;                // route or switching machine owning the locks
    LockType lockType = LockType::Lock;
    ResolveStrategy strategy = ResolveStrategy::General;
    bool emitSwitchingMachineRoutes = false;
};

// Writes parsed lock groups into the registry as Lock / LockCondition /
// LockConditionObject rows. All leaves are resolved before anything is
// written, so a fatal resolution leaves the registry untouched.
class LockGraphMaterializer {
public:
    LockGraphMaterializer(InterlockingRegistry& registry, const NameResolver& resolver);

    CompileResult materialize(const QList<LockItem>& groups, const MaterializeRequest& request);

    int skippedLeafCount() const { return m_skippedLeafCount; }

private:
    CompileResult resolveLeaves(const LockItem& item, ResolveStrategy strategy,
                                QList<Resolution>& resolutions);
    void writeItem(const LockItem& item, qulonglong lockId, std::optional<qulonglong> parentId,
                   const MaterializeRequest& request, QList<Resolution>& resolutions);
    void writeLeafObject(const LockItem& item, const InterlockingObject& target, qulonglong lockId,
                         std::optional<qulonglong> parentId, const MaterializeRequest& request);

    static LockConditionType conditionType(const LockItem& item);

    InterlockingRegistry& m_registry;
    const NameResolver& m_resolver;
    int m_skippedLeafCount = 0;
};

} // namespace RailSeed::Locking
