#pragma once

#include "core/experiment/experiment_store.h"

#include <memory>
#include <mutex>

struct sqlite3;

namespace sr {

// SqliteExperimentStore -- ExperimentStore persisted in a SQLite database.
// One connection per store, serialized by an internal mutex.
class SqliteExperimentStore : public ExperimentStore {
public:
    ~SqliteExperimentStore() override;

    SqliteExperimentStore(const SqliteExperimentStore&) = delete;
    SqliteExperimentStore& operator=(const SqliteExperimentStore&) = delete;

    // Open or create the database at the given path (":memory:" accepted).
    // Creates schema and sets pragmas on first open.
    static std::unique_ptr<SqliteExperimentStore> open(const QString& dbPath,
                                                       QString* errorOut = nullptr);

    bool appendEvent(const ExperimentEvent& event, QString* errorOut = nullptr) override;
    std::vector<ExperimentEvent> eventsSince(const QDateTime& cutoff,
                                             const QString& variantName = {}) const override;
    int pruneBefore(const QDateTime& cutoff) override;

    bool recordAssignment(const QString& sessionId, const QString& variantName,
                          QString* errorOut = nullptr) override;
    std::optional<QString> assignment(const QString& sessionId) const override;

private:
    SqliteExperimentStore() = default;

    bool init(const QString& dbPath, QString* errorOut);
    bool execSql(const char* sql, QString* errorOut = nullptr);

    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace sr
