#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

namespace sr {

struct ExperimentEvent {
    QString sessionId;
    QString variantName;
    QString candidateId;
    EventKind kind = EventKind::Impression;
    int position = 0;       // 1-based rank the candidate was shown at; 0 = unknown
    QDateTime timestamp;    // UTC
};

// ExperimentStore -- append-only event log plus the first-wins table of
// session -> variant assignments. Implementations must be thread-safe.
class ExperimentStore {
public:
    virtual ~ExperimentStore() = default;

    virtual bool appendEvent(const ExperimentEvent& event, QString* errorOut = nullptr) = 0;

    // Events with timestamp >= cutoff, in insertion order. Empty variantName
    // returns every variant.
    virtual std::vector<ExperimentEvent> eventsSince(const QDateTime& cutoff,
                                                     const QString& variantName = {}) const = 0;

    // Removes events older than cutoff. Returns the number removed, -1 on failure.
    virtual int pruneBefore(const QDateTime& cutoff) = 0;

    // Records the session's variant unless one is already recorded.
    virtual bool recordAssignment(const QString& sessionId, const QString& variantName,
                                  QString* errorOut = nullptr) = 0;
    virtual std::optional<QString> assignment(const QString& sessionId) const = 0;
};

} // namespace sr
