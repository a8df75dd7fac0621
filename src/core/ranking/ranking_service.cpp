#include "core/ranking/ranking_service.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QJsonArray>

namespace sr {

namespace {

std::vector<QString> variantNames(const RankingConfig& config)
{
    std::vector<QString> names;
    names.reserve(config.variants.size());
    for (const auto& variant : config.variants) {
        names.push_back(variant.name);
    }
    return names;
}

} // namespace

std::unique_ptr<RankingService> RankingService::create(const RankingConfig& config,
                                                       std::unique_ptr<ExperimentStore> store,
                                                       QString* errorOut)
{
    QString error;
    if (!config.validate(&error)) {
        LOG_ERROR(srConfig, "Invalid ranking configuration: %s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return nullptr;
    }
    if (!store) {
        if (errorOut) {
            *errorOut = QStringLiteral("an experiment store is required");
        }
        return nullptr;
    }
    return std::unique_ptr<RankingService>(new RankingService(config, std::move(store)));
}

RankingService::RankingService(const RankingConfig& config,
                               std::unique_ptr<ExperimentStore> store)
    : m_config(config)
    , m_store(std::move(store))
    , m_pool(static_cast<size_t>(config.workerThreads))
    , m_selector(m_config, m_store.get())
    , m_engine(m_config, m_selector, &m_pool)
    , m_tracker(*m_store, m_config.experiment, variantNames(m_config))
{
    LOG_INFO(srRanking, "RankingService ready: %d variant(s), default '%s', %d worker(s)",
             static_cast<int>(m_config.variants.size()),
             qUtf8Printable(m_config.defaultVariant),
             static_cast<int>(m_pool.threadCount()));
}

std::optional<RankResponse> RankingService::rank(const RankRequest& request, QString* errorOut)
{
    QElapsedTimer timer;
    timer.start();

    std::optional<RankResponse> response = m_engine.rank(request, errorOut);
    updateStats(response, timer.elapsed());
    return response;
}

void RankingService::updateStats(const std::optional<RankResponse>& response, qint64 elapsedMs)
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    if (!response) {
        ++m_stats.rejectedRequests;
        return;
    }

    ++m_stats.totalSearches;
    const double n = static_cast<double>(m_stats.totalSearches);
    m_stats.averageResponseTimeMs =
        (m_stats.averageResponseTimeMs * (n - 1.0) + static_cast<double>(elapsedMs)) / n;
    m_stats.variantUsage[response->variantName] += 1;
    if (response->timedOut) {
        ++m_stats.timedOutRequests;
    }
}

void RankingService::recordInteraction(const ExperimentEvent& event)
{
    m_tracker.record(event);
}

SearchStats RankingService::searchStats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

QJsonObject RankingService::searchStatsToJson() const
{
    const SearchStats stats = searchStats();

    QJsonObject usage;
    for (auto it = stats.variantUsage.constBegin(); it != stats.variantUsage.constEnd(); ++it) {
        usage[it.key()] = static_cast<double>(it.value());
    }

    QJsonObject obj;
    obj[QStringLiteral("totalSearches")] = static_cast<double>(stats.totalSearches);
    obj[QStringLiteral("rejectedRequests")] = static_cast<double>(stats.rejectedRequests);
    obj[QStringLiteral("timedOutRequests")] = static_cast<double>(stats.timedOutRequests);
    obj[QStringLiteral("averageResponseTimeMs")] = stats.averageResponseTimeMs;
    obj[QStringLiteral("variantUsage")] = usage;
    return obj;
}

QJsonObject RankingService::getPerformance(const std::optional<QString>& variant,
                                           const std::optional<ExperimentMetric>& metric,
                                           const QDateTime& now) const
{
    QJsonObject out = m_tracker.report(variant, now);
    out[QStringLiteral("searchStats")] = searchStatsToJson();

    if (metric) {
        QJsonObject values;
        const QJsonArray variants = out.value(QStringLiteral("variants")).toArray();
        const QString key = *metric == ExperimentMetric::Ctr ? QStringLiteral("ctr")
                                                             : QStringLiteral("conversion");
        for (const QJsonValue& v : variants) {
            const QJsonObject stats = v.toObject();
            values[stats.value(QStringLiteral("variant")).toString()] = stats.value(key);
        }
        out[QStringLiteral("metric")] = experimentMetricToString(*metric);
        out[QStringLiteral("values")] = values;
    }
    return out;
}

int RankingService::pruneExpired(const QDateTime& now)
{
    return m_tracker.pruneExpired(now);
}

} // namespace sr
