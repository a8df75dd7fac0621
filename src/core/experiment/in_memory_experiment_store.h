#pragma once

#include "core/experiment/experiment_store.h"

#include <QHash>

#include <mutex>

namespace sr {

class InMemoryExperimentStore : public ExperimentStore {
public:
    InMemoryExperimentStore() = default;

    bool appendEvent(const ExperimentEvent& event, QString* errorOut = nullptr) override;
    std::vector<ExperimentEvent> eventsSince(const QDateTime& cutoff,
                                             const QString& variantName = {}) const override;
    int pruneBefore(const QDateTime& cutoff) override;

    bool recordAssignment(const QString& sessionId, const QString& variantName,
                          QString* errorOut = nullptr) override;
    std::optional<QString> assignment(const QString& sessionId) const override;

    size_t eventCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<ExperimentEvent> m_events;
    QHash<QString, QString> m_assignments;
};

} // namespace sr
