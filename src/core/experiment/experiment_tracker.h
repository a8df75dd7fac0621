#pragma once

#include "core/experiment/experiment_store.h"
#include "core/shared/ranking_config.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <atomic>
#include <optional>
#include <vector>

namespace sr {

enum class ExperimentMetric {
    Ctr,
    Conversion,
};

QString experimentMetricToString(ExperimentMetric metric);
std::optional<ExperimentMetric> experimentMetricFromString(const QString& str);

// Aggregates for one variant inside the retention window. Counts are distinct
// (session, candidate) pairs.
struct VariantStats {
    QString variant;
    int impressions = 0;
    int clicks = 0;
    int purchases = 0;
    double ctr = 0.0;
    double conversion = 0.0;
    double meanClickPosition = 0.0;  // over click events carrying a position
};

struct Recommendation {
    ExperimentMetric metric = ExperimentMetric::Ctr;
    QString variant;
    double value = 0.0;
    int sampleSize = 0;
    QString runnerUp;       // empty when only one variant qualified
    double zScore = 0.0;    // two-proportion z against the runner-up
    bool significant = false;
};

// ExperimentTracker -- records interaction events and evaluates variants.
//
// record() never fails the caller: invalid events and store failures are
// logged and counted as dropped. Every "now" parameter defaults to the
// current UTC time.
class ExperimentTracker {
public:
    ExperimentTracker(ExperimentStore& store,
                      const ExperimentSettings& settings,
                      std::vector<QString> variantNames);

    void record(ExperimentEvent event);

    double performance(const QString& variant, ExperimentMetric metric,
                       const QDateTime& now = {}) const;
    VariantStats stats(const QString& variant, const QDateTime& now = {}) const;
    std::vector<VariantStats> allStats(const QDateTime& now = {}) const;

    std::vector<Recommendation> recommend(const QDateTime& now = {}) const;
    QJsonObject report(const std::optional<QString>& variant = std::nullopt,
                       const QDateTime& now = {}) const;

    // Deletes events older than the retention window. -1 on store failure.
    int pruneExpired(const QDateTime& now = {});

    QDateTime windowStart(const QDateTime& now = {}) const;

    quint64 recordedCount() const { return m_recorded.load(); }
    quint64 droppedCount() const { return m_dropped.load(); }

    // Two-proportion z statistic of x1/n1 against x2/n2; 0 when undefined.
    static double twoProportionZ(int x1, int n1, int x2, int n2);

private:
    bool isKnownVariant(const QString& name) const;
    std::vector<VariantStats> computeStats(const std::vector<QString>& names,
                                           const QDateTime& now) const;
    std::optional<Recommendation> pickBest(const std::vector<VariantStats>& stats,
                                           ExperimentMetric metric) const;
    void drop(const char* reason);

    ExperimentStore& m_store;
    ExperimentSettings m_settings;
    std::vector<QString> m_variantNames;

    std::atomic<quint64> m_recorded{0};
    std::atomic<quint64> m_dropped{0};
};

} // namespace sr
