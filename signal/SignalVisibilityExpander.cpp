#include "SignalVisibilityExpander.h"
#include <QDebug>

namespace RailSeed {

SignalVisibilityExpander::SignalVisibilityExpander(InterlockingRegistry& registry)
    : m_registry(registry) {}

int SignalVisibilityExpander::indexOf(const QString& name) {
    auto it = m_indexByName.constFind(name);
    if (it != m_indexByName.constEnd()) {
        return it.value();
    }
    const int index = m_names.size();
    m_names.append(name);
    m_indexByName.insert(name, index);
    return index;
}

void SignalVisibilityExpander::buildArena() {
    m_names.clear();
    m_indexByName.clear();
    m_origins.clear();

    for (const InterlockingObject* signal : m_registry.objectsOfType(ObjectType::Signal)) {
        m_origins.push_back(indexOf(signal->name));
    }

    const QList<NextSignal>& rows = m_registry.nextSignals().rows();
    for (const NextSignal& row : rows) {
        indexOf(row.signalName);
        indexOf(row.targetSignalName);
    }

    const size_t count = size_t(m_names.size());
    m_byDepth.assign(MAX_DEPTH + 1, std::vector<std::vector<int>>(count));
    m_known.assign(count, QSet<int>());

    for (const NextSignal& row : rows) {
        const int origin = m_indexByName.value(row.signalName);
        const int target = m_indexByName.value(row.targetSignalName);
        m_known[origin].insert(target);
        if (row.depth >= 1 && row.depth <= MAX_DEPTH) {
            m_byDepth[row.depth][origin].push_back(target);
        }
    }
}

int SignalVisibilityExpander::expand() {
    buildArena();

    const std::vector<std::vector<int>>& direct = m_byDepth[1];
    int added = 0;

    for (int depth = 2; depth <= MAX_DEPTH; ++depth) {
        for (int origin : m_origins) {
            for (int middle : m_byDepth[depth - 1][origin]) {
                for (int target : direct[middle]) {
                    if (m_known[origin].contains(target)) {
                        continue;
                    }
                    m_known[origin].insert(target);
                    m_byDepth[depth][origin].push_back(target);

                    NextSignal row;
                    row.signalName = m_names.at(origin);
                    row.sourceSignalName = m_names.at(middle);
                    row.targetSignalName = m_names.at(target);
                    row.depth = depth;
                    m_registry.addNextSignal(row);
                    ++added;
                }
            }
        }
    }

    qDebug() << " [SignalVisibilityExpander] Added" << added << "next signal rows over"
             << m_origins.size() << "signals";
    return added;
}

} // namespace RailSeed
