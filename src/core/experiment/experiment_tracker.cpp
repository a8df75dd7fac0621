#include "core/experiment/experiment_tracker.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QHash>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace sr {

namespace {

QDateTime resolveNow(const QDateTime& now)
{
    return now.isValid() ? now.toUTC() : QDateTime::currentDateTimeUtc();
}

QString pairKey(const ExperimentEvent& event)
{
    return event.sessionId + QChar(0x1f) + event.candidateId;
}

double ratio(int numerator, int denominator)
{
    if (denominator <= 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(numerator) / denominator);
}

QString percent(double value)
{
    return QString::number(value * 100.0, 'f', 1) + QLatin1Char('%');
}

} // namespace

QString experimentMetricToString(ExperimentMetric metric)
{
    switch (metric) {
    case ExperimentMetric::Ctr:        return QStringLiteral("ctr");
    case ExperimentMetric::Conversion: return QStringLiteral("conversion");
    }
    return QStringLiteral("ctr");
}

std::optional<ExperimentMetric> experimentMetricFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("ctr") || lower == QLatin1String("click_through_rate")) {
        return ExperimentMetric::Ctr;
    }
    if (lower == QLatin1String("conversion") || lower == QLatin1String("conversion_rate")) {
        return ExperimentMetric::Conversion;
    }
    return std::nullopt;
}

ExperimentTracker::ExperimentTracker(ExperimentStore& store,
                                     const ExperimentSettings& settings,
                                     std::vector<QString> variantNames)
    : m_store(store)
    , m_settings(settings)
    , m_variantNames(std::move(variantNames))
{
}

void ExperimentTracker::drop(const char* reason)
{
    m_dropped.fetch_add(1);
    LOG_WARN(srExperiment, "Dropping experiment event: %s", reason);
}

bool ExperimentTracker::isKnownVariant(const QString& name) const
{
    return std::find(m_variantNames.begin(), m_variantNames.end(), name)
        != m_variantNames.end();
}

void ExperimentTracker::record(ExperimentEvent event)
{
    if (event.sessionId.isEmpty()) {
        drop("missing session id");
        return;
    }
    if (event.candidateId.isEmpty()) {
        drop("missing candidate id");
        return;
    }
    if (event.position < 0) {
        drop("negative position");
        return;
    }

    if (event.variantName.isEmpty()) {
        const std::optional<QString> assigned = m_store.assignment(event.sessionId);
        if (!assigned) {
            drop("no variant recorded for session");
            return;
        }
        event.variantName = *assigned;
    }
    if (!isKnownVariant(event.variantName)) {
        drop("unknown variant");
        return;
    }

    if (!event.timestamp.isValid()) {
        event.timestamp = QDateTime::currentDateTimeUtc();
    } else {
        event.timestamp = event.timestamp.toUTC();
    }

    QString error;
    if (!m_store.appendEvent(event, &error)) {
        m_dropped.fetch_add(1);
        LOG_WARN(srExperiment, "Experiment store write failed: %s", qUtf8Printable(error));
        return;
    }
    m_recorded.fetch_add(1);
}

QDateTime ExperimentTracker::windowStart(const QDateTime& now) const
{
    return resolveNow(now).addDays(-m_settings.retentionDays);
}

std::vector<VariantStats> ExperimentTracker::computeStats(const std::vector<QString>& names,
                                                          const QDateTime& now) const
{
    struct Tally {
        QSet<QString> impressed;
        QSet<QString> clicked;
        QSet<QString> purchased;
        qint64 positionSum = 0;
        int positionCount = 0;
    };

    const QString filter = names.size() == 1 ? names.front() : QString();
    const std::vector<ExperimentEvent> events = m_store.eventsSince(windowStart(now), filter);
    const QDateTime end = resolveNow(now);

    QHash<QString, Tally> tallies;
    for (const auto& event : events) {
        if (event.timestamp > end) {
            continue;
        }
        Tally& tally = tallies[event.variantName];
        switch (event.kind) {
        case EventKind::Impression:
            tally.impressed.insert(pairKey(event));
            break;
        case EventKind::Click:
            tally.clicked.insert(pairKey(event));
            if (event.position > 0) {
                tally.positionSum += event.position;
                ++tally.positionCount;
            }
            break;
        case EventKind::Purchase:
            tally.purchased.insert(pairKey(event));
            break;
        }
    }

    std::vector<VariantStats> out;
    out.reserve(names.size());
    for (const QString& name : names) {
        VariantStats stats;
        stats.variant = name;
        auto it = tallies.constFind(name);
        if (it != tallies.constEnd()) {
            stats.impressions = static_cast<int>(it->impressed.size());
            stats.clicks = static_cast<int>(it->clicked.size());
            stats.purchases = static_cast<int>(it->purchased.size());
            stats.ctr = ratio(stats.clicks, stats.impressions);
            stats.conversion = ratio(stats.purchases, stats.clicks);
            if (it->positionCount > 0) {
                stats.meanClickPosition =
                    static_cast<double>(it->positionSum) / it->positionCount;
            }
        }
        out.push_back(std::move(stats));
    }
    return out;
}

double ExperimentTracker::performance(const QString& variant, ExperimentMetric metric,
                                      const QDateTime& now) const
{
    const VariantStats s = stats(variant, now);
    return metric == ExperimentMetric::Ctr ? s.ctr : s.conversion;
}

VariantStats ExperimentTracker::stats(const QString& variant, const QDateTime& now) const
{
    return computeStats({variant}, now).front();
}

std::vector<VariantStats> ExperimentTracker::allStats(const QDateTime& now) const
{
    return computeStats(m_variantNames, now);
}

double ExperimentTracker::twoProportionZ(int x1, int n1, int x2, int n2)
{
    if (n1 <= 0 || n2 <= 0) {
        return 0.0;
    }
    const double p1 = std::min(1.0, static_cast<double>(x1) / n1);
    const double p2 = std::min(1.0, static_cast<double>(x2) / n2);
    const double pooled = std::min(1.0, static_cast<double>(x1 + x2) / (n1 + n2));
    const double se = std::sqrt(pooled * (1.0 - pooled) * (1.0 / n1 + 1.0 / n2));
    if (se <= 0.0) {
        return 0.0;
    }
    return (p1 - p2) / se;
}

std::optional<Recommendation> ExperimentTracker::pickBest(const std::vector<VariantStats>& stats,
                                                          ExperimentMetric metric) const
{
    const bool ctr = metric == ExperimentMetric::Ctr;
    const int minSample = ctr ? m_settings.minImpressionSample : m_settings.minClickSample;

    std::vector<const VariantStats*> qualified;
    for (const auto& s : stats) {
        const int sample = ctr ? s.impressions : s.clicks;
        if (sample >= minSample) {
            qualified.push_back(&s);
        }
    }
    if (qualified.empty()) {
        return std::nullopt;
    }

    // Highest value first; name ascending keeps ties deterministic.
    std::stable_sort(qualified.begin(), qualified.end(),
                     [ctr](const VariantStats* a, const VariantStats* b) {
                         const double va = ctr ? a->ctr : a->conversion;
                         const double vb = ctr ? b->ctr : b->conversion;
                         if (va != vb) {
                             return va > vb;
                         }
                         return a->variant < b->variant;
                     });

    const VariantStats& best = *qualified.front();
    Recommendation rec;
    rec.metric = metric;
    rec.variant = best.variant;
    rec.value = ctr ? best.ctr : best.conversion;
    rec.sampleSize = ctr ? best.impressions : best.clicks;

    if (qualified.size() > 1) {
        const VariantStats& second = *qualified[1];
        rec.runnerUp = second.variant;
        rec.zScore = ctr
            ? twoProportionZ(best.clicks, best.impressions, second.clicks, second.impressions)
            : twoProportionZ(best.purchases, best.clicks, second.purchases, second.clicks);
        rec.significant = rec.zScore >= m_settings.significanceZ;
    }
    return rec;
}

std::vector<Recommendation> ExperimentTracker::recommend(const QDateTime& now) const
{
    const std::vector<VariantStats> stats = allStats(now);
    std::vector<Recommendation> out;
    if (auto rec = pickBest(stats, ExperimentMetric::Ctr)) {
        out.push_back(*rec);
    }
    if (auto rec = pickBest(stats, ExperimentMetric::Conversion)) {
        out.push_back(*rec);
    }
    return out;
}

QJsonObject ExperimentTracker::report(const std::optional<QString>& variant,
                                      const QDateTime& now) const
{
    QJsonArray notes;
    QJsonArray variantsJson;

    std::vector<VariantStats> stats;
    if (variant) {
        if (isKnownVariant(*variant)) {
            stats = computeStats({*variant}, now);
        } else {
            notes.append(QStringLiteral("Unknown variant: %1").arg(*variant));
        }
    } else {
        stats = allStats(now);
    }

    for (const auto& s : stats) {
        QJsonObject obj;
        obj[QStringLiteral("variant")] = s.variant;
        obj[QStringLiteral("impressions")] = s.impressions;
        obj[QStringLiteral("clicks")] = s.clicks;
        obj[QStringLiteral("purchases")] = s.purchases;
        obj[QStringLiteral("ctr")] = s.ctr;
        obj[QStringLiteral("conversion")] = s.conversion;
        obj[QStringLiteral("meanClickPosition")] = s.meanClickPosition;
        variantsJson.append(obj);
    }

    QJsonArray recommendationsJson;
    const std::vector<Recommendation> recommendations = recommend(now);
    for (const auto& rec : recommendations) {
        QJsonObject obj;
        obj[QStringLiteral("metric")] = experimentMetricToString(rec.metric);
        obj[QStringLiteral("variant")] = rec.variant;
        obj[QStringLiteral("value")] = rec.value;
        obj[QStringLiteral("sampleSize")] = rec.sampleSize;
        if (!rec.runnerUp.isEmpty()) {
            obj[QStringLiteral("runnerUp")] = rec.runnerUp;
        }
        obj[QStringLiteral("zScore")] = rec.zScore;
        obj[QStringLiteral("significant")] = rec.significant;
        recommendationsJson.append(obj);

        const QString what = rec.metric == ExperimentMetric::Ctr
            ? QStringLiteral("click-through rate")
            : QStringLiteral("conversion rate");
        QString note = QStringLiteral("Consider %1 for better %2 (%3)")
                           .arg(rec.variant, what, percent(rec.value));
        if (!rec.significant) {
            note += QStringLiteral("; not yet statistically significant");
        }
        notes.append(note);
    }
    if (recommendations.empty()) {
        notes.append(QStringLiteral("Insufficient data for performance recommendations"));
    }

    QJsonObject out;
    out[QStringLiteral("windowStart")] = windowStart(now).toString(Qt::ISODateWithMs);
    out[QStringLiteral("retentionDays")] = m_settings.retentionDays;
    out[QStringLiteral("variants")] = variantsJson;
    out[QStringLiteral("recommendations")] = recommendationsJson;
    out[QStringLiteral("notes")] = notes;
    out[QStringLiteral("recordedEvents")] = static_cast<double>(recordedCount());
    out[QStringLiteral("droppedEvents")] = static_cast<double>(droppedCount());
    return out;
}

int ExperimentTracker::pruneExpired(const QDateTime& now)
{
    const int removed = m_store.pruneBefore(windowStart(now));
    if (removed < 0) {
        LOG_WARN(srExperiment, "Pruning expired experiment events failed");
    } else if (removed > 0) {
        LOG_INFO(srExperiment, "Pruned %d expired experiment event(s)", removed);
    }
    return removed;
}

} // namespace sr
