#pragma once

#include "core/experiment/experiment_store.h"
#include "core/experiment/experiment_tracker.h"
#include "core/experiment/variant_selector.h"
#include "core/ranking/ranking_engine.h"
#include "core/shared/ranking_config.h"
#include "core/shared/worker_pool.h"

#include <QHash>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>

namespace sr {

struct SearchStats {
    quint64 totalSearches = 0;
    quint64 rejectedRequests = 0;
    quint64 timedOutRequests = 0;
    double averageResponseTimeMs = 0.0;
    QHash<QString, quint64> variantUsage;
};

// RankingService -- the outbound surface: rank, recordInteraction and
// getPerformance, wired over one validated RankingConfig and an injected
// ExperimentStore. Thread-safe.
class RankingService {
public:
    // nullptr (with errorOut) when the configuration does not validate.
    static std::unique_ptr<RankingService> create(const RankingConfig& config,
                                                  std::unique_ptr<ExperimentStore> store,
                                                  QString* errorOut = nullptr);

    RankingService(const RankingService&) = delete;
    RankingService& operator=(const RankingService&) = delete;

    std::optional<RankResponse> rank(const RankRequest& request, QString* errorOut = nullptr);

    // Fire-and-forget.
    void recordInteraction(const ExperimentEvent& event);

    // Experiment report plus request statistics. With a metric, adds
    // "metric" and a per-variant "values" object.
    QJsonObject getPerformance(const std::optional<QString>& variant = std::nullopt,
                               const std::optional<ExperimentMetric>& metric = std::nullopt,
                               const QDateTime& now = {}) const;

    int pruneExpired(const QDateTime& now = {});

    SearchStats searchStats() const;
    QJsonObject searchStatsToJson() const;

    const RankingConfig& config() const { return m_config; }
    VariantSelector& selector() { return m_selector; }
    ExperimentTracker& tracker() { return m_tracker; }
    ExperimentStore& store() { return *m_store; }

private:
    RankingService(const RankingConfig& config, std::unique_ptr<ExperimentStore> store);

    void updateStats(const std::optional<RankResponse>& response, qint64 elapsedMs);

    RankingConfig m_config;
    std::unique_ptr<ExperimentStore> m_store;
    WorkerPool m_pool;
    VariantSelector m_selector;
    RankingEngine m_engine;
    ExperimentTracker m_tracker;

    mutable std::mutex m_statsMutex;
    SearchStats m_stats;
};

} // namespace sr
