#pragma once
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <vector>
#include "../model/InterlockingRegistry.h"

namespace RailSeed {

// Extends the depth-1 next-signal rows to chains of up to MAX_DEPTH hops.
// A (signal, target) pair is recorded once, at the depth where the target is
// first reached. Signal names are mapped to arena indices once up front.
class SignalVisibilityExpander {
public:
    static constexpr int MAX_DEPTH = 4;

    explicit SignalVisibilityExpander(InterlockingRegistry& registry);

    // Returns the number of rows added to the registry.
    int expand();

private:
    int indexOf(const QString& name);
    void buildArena();

    InterlockingRegistry& m_registry;

    QStringList m_names;
    QHash<QString, int> m_indexByName;
    std::vector<int> m_origins;                             // signals, registry order
    std::vector<std::vector<std::vector<int>>> m_byDepth;   // [depth][origin] -> targets
    std::vector<QSet<int>> m_known;                         // [origin] -> targets at any depth
};

} // namespace RailSeed
