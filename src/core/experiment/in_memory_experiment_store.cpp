#include "core/experiment/in_memory_experiment_store.h"

#include <algorithm>

namespace sr {

bool InMemoryExperimentStore::appendEvent(const ExperimentEvent& event, QString* errorOut)
{
    if (!event.timestamp.isValid()) {
        if (errorOut) {
            *errorOut = QStringLiteral("event timestamp is invalid");
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
    return true;
}

std::vector<ExperimentEvent> InMemoryExperimentStore::eventsSince(const QDateTime& cutoff,
                                                                  const QString& variantName) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ExperimentEvent> out;
    for (const auto& event : m_events) {
        if (cutoff.isValid() && event.timestamp < cutoff) {
            continue;
        }
        if (!variantName.isEmpty() && event.variantName != variantName) {
            continue;
        }
        out.push_back(event);
    }
    return out;
}

int InMemoryExperimentStore::pruneBefore(const QDateTime& cutoff)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t before = m_events.size();
    m_events.erase(std::remove_if(m_events.begin(), m_events.end(),
                                  [&cutoff](const ExperimentEvent& event) {
                                      return event.timestamp < cutoff;
                                  }),
                   m_events.end());
    return static_cast<int>(before - m_events.size());
}

bool InMemoryExperimentStore::recordAssignment(const QString& sessionId,
                                               const QString& variantName,
                                               QString* errorOut)
{
    if (sessionId.isEmpty() || variantName.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("session id and variant name are required");
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_assignments.contains(sessionId)) {
        m_assignments.insert(sessionId, variantName);
    }
    return true;
}

std::optional<QString> InMemoryExperimentStore::assignment(const QString& sessionId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_assignments.constFind(sessionId);
    if (it == m_assignments.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

size_t InMemoryExperimentStore::eventCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

} // namespace sr
