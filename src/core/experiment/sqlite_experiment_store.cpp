#include "core/experiment/sqlite_experiment_store.h"
#include "core/experiment/experiment_schema.h"
#include "core/shared/logging.h"

#include <QDebug>

#include <sqlite3.h>

#include <limits>

namespace sr {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return raw ? QString::fromUtf8(raw) : QString();
}

} // namespace

SqliteExperimentStore::~SqliteExperimentStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SqliteExperimentStore> SqliteExperimentStore::open(const QString& dbPath,
                                                                   QString* errorOut)
{
    std::unique_ptr<SqliteExperimentStore> store(new SqliteExperimentStore());
    if (!store->init(dbPath, errorOut)) {
        return nullptr;
    }
    return store;
}

bool SqliteExperimentStore::init(const QString& dbPath, QString* errorOut)
{
    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("failed to open experiment database %1: %2")
                                    .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(m_db)));
        LOG_ERROR(srExperiment, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kExperimentConnectionPragmas, errorOut)) {
        LOG_ERROR(srExperiment, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='experiment_events'",
                -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        // In-memory databases keep journal_mode=memory; not an error.
        if (!execSql(kExperimentDatabasePragmas, errorOut)) {
            LOG_ERROR(srExperiment, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kExperimentSchemaV1, errorOut)) {
            LOG_ERROR(srExperiment, "Failed to create experiment schema");
            return false;
        }
    }

    LOG_INFO(srExperiment, "Experiment store opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SqliteExperimentStore::execSql(const char* sql, QString* errorOut)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(srExperiment, "SQL error: %s", qUtf8Printable(message));
        setError(errorOut, message);
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SqliteExperimentStore::appendEvent(const ExperimentEvent& event, QString* errorOut)
{
    if (!event.timestamp.isValid()) {
        setError(errorOut, QStringLiteral("event timestamp is invalid"));
        return false;
    }

    static constexpr const char* kSql = R"(
        INSERT INTO experiment_events (
            session_id,
            variant,
            candidate_id,
            kind,
            position,
            timestamp_ms
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "SqliteExperimentStore::appendEvent prepare failed:" << sqlite3_errmsg(m_db);
        setError(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return false;
    }

    const QByteArray sessionUtf8 = event.sessionId.toUtf8();
    const QByteArray variantUtf8 = event.variantName.toUtf8();
    const QByteArray candidateUtf8 = event.candidateId.toUtf8();
    const QByteArray kindUtf8 = eventKindToString(event.kind).toUtf8();

    sqlite3_bind_text(stmt, 1, sessionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, variantUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, candidateUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, kindUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 5, event.position);
    sqlite3_bind_int64(stmt, 6, event.timestamp.toMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        qWarning() << "SqliteExperimentStore::appendEvent step failed:" << sqlite3_errmsg(m_db);
        setError(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return false;
    }
    return true;
}

std::vector<ExperimentEvent> SqliteExperimentStore::eventsSince(const QDateTime& cutoff,
                                                                const QString& variantName) const
{
    static constexpr const char* kSql = R"(
        SELECT session_id, variant, candidate_id, kind, position, timestamp_ms
        FROM experiment_events
        WHERE timestamp_ms >= ?1
          AND (?2 IS NULL OR variant = ?2)
        ORDER BY id
    )";

    std::vector<ExperimentEvent> events;
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "SqliteExperimentStore::eventsSince prepare failed:" << sqlite3_errmsg(m_db);
        return events;
    }

    const qint64 cutoffMs = cutoff.isValid() ? cutoff.toMSecsSinceEpoch()
                                             : std::numeric_limits<qint64>::min();
    const QByteArray variantUtf8 = variantName.toUtf8();
    sqlite3_bind_int64(stmt, 1, cutoffMs);
    if (variantName.isEmpty()) {
        sqlite3_bind_null(stmt, 2);
    } else {
        sqlite3_bind_text(stmt, 2, variantUtf8.constData(), -1, SQLITE_STATIC);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const std::optional<EventKind> kind = eventKindFromString(columnText(stmt, 3));
        if (!kind) {
            continue;
        }
        ExperimentEvent event;
        event.sessionId = columnText(stmt, 0);
        event.variantName = columnText(stmt, 1);
        event.candidateId = columnText(stmt, 2);
        event.kind = *kind;
        event.position = sqlite3_column_int(stmt, 4);
        event.timestamp = QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 5), Qt::UTC);
        events.push_back(std::move(event));
    }
    sqlite3_finalize(stmt);
    return events;
}

int SqliteExperimentStore::pruneBefore(const QDateTime& cutoff)
{
    static constexpr const char* kSql = "DELETE FROM experiment_events WHERE timestamp_ms < ?1";

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "SqliteExperimentStore::pruneBefore prepare failed:" << sqlite3_errmsg(m_db);
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, cutoff.toMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "SqliteExperimentStore::pruneBefore step failed:" << sqlite3_errmsg(m_db);
        return -1;
    }
    return sqlite3_changes(m_db);
}

bool SqliteExperimentStore::recordAssignment(const QString& sessionId,
                                             const QString& variantName,
                                             QString* errorOut)
{
    if (sessionId.isEmpty() || variantName.isEmpty()) {
        setError(errorOut, QStringLiteral("session id and variant name are required"));
        return false;
    }

    static constexpr const char* kSql = R"(
        INSERT OR IGNORE INTO experiment_assignments (session_id, variant, assigned_at_ms)
        VALUES (?1, ?2, ?3)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "SqliteExperimentStore::recordAssignment prepare failed:" << sqlite3_errmsg(m_db);
        setError(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return false;
    }

    const QByteArray sessionUtf8 = sessionId.toUtf8();
    const QByteArray variantUtf8 = variantName.toUtf8();
    sqlite3_bind_text(stmt, 1, sessionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, variantUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "SqliteExperimentStore::recordAssignment step failed:" << sqlite3_errmsg(m_db);
        setError(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return false;
    }
    return true;
}

std::optional<QString> SqliteExperimentStore::assignment(const QString& sessionId) const
{
    static constexpr const char* kSql =
        "SELECT variant FROM experiment_assignments WHERE session_id = ?1";

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "SqliteExperimentStore::assignment prepare failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }

    const QByteArray sessionUtf8 = sessionId.toUtf8();
    sqlite3_bind_text(stmt, 1, sessionUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> variant;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        variant = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return variant;
}

} // namespace sr
