#include "core/experiment/variant_selector.h"
#include "core/experiment/experiment_store.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QtEndian>

#include <cmath>

namespace sr {

VariantSelector::VariantSelector(const RankingConfig& config, ExperimentStore* store)
    : m_variants(config.variants)
    , m_store(store)
{
    double totalShare = 0.0;
    for (const auto& variant : m_variants) {
        totalShare += variant.trafficShare;
    }

    double cumulative = 0.0;
    m_upperBounds.reserve(m_variants.size());
    for (size_t i = 0; i < m_variants.size(); ++i) {
        cumulative += m_variants[i].trafficShare;
        int bound = totalShare > 0.0
            ? static_cast<int>(std::lround(cumulative / totalShare * kBucketCount))
            : static_cast<int>((i + 1) * kBucketCount / m_variants.size());
        if (i + 1 == m_variants.size()) {
            bound = kBucketCount;
        }
        m_upperBounds.push_back(bound);
    }

    for (size_t i = 0; i < m_variants.size(); ++i) {
        if (m_variants[i].name == config.defaultVariant) {
            m_defaultIndex = i;
            break;
        }
    }
}

int VariantSelector::bucketFor(const QString& id)
{
    const QByteArray digest = QCryptographicHash::hash(id.toUtf8(), QCryptographicHash::Sha256);
    const quint64 prefix = qFromBigEndian<quint64>(digest.constData());
    return static_cast<int>(prefix % static_cast<quint64>(kBucketCount));
}

const VariantConfig& VariantSelector::assign(const QString& id) const
{
    if (id.isEmpty()) {
        return defaultVariant();
    }

    const int bucket = bucketFor(id);
    for (size_t i = 0; i < m_variants.size(); ++i) {
        if (bucket < m_upperBounds[i]) {
            return m_variants[i];
        }
    }
    return defaultVariant();
}

const VariantConfig& VariantSelector::assignAndRecord(const QString& sessionId,
                                                      const QString& userId)
{
    if (m_store && !sessionId.isEmpty()) {
        const std::optional<QString> recorded = m_store->assignment(sessionId);
        if (recorded) {
            if (const VariantConfig* existing = variant(*recorded)) {
                return *existing;
            }
            LOG_DEBUG(srExperiment, "Recorded variant %s for session is no longer configured",
                      qUtf8Printable(*recorded));
        }
    }

    const VariantConfig& chosen = assign(userId.isEmpty() ? sessionId : userId);

    if (m_store && !sessionId.isEmpty()) {
        QString error;
        if (!m_store->recordAssignment(sessionId, chosen.name, &error)) {
            LOG_WARN(srExperiment, "Failed to record variant assignment: %s",
                     qUtf8Printable(error));
        }
    }
    return chosen;
}

const VariantConfig* VariantSelector::variant(const QString& name) const
{
    for (const auto& v : m_variants) {
        if (v.name == name) {
            return &v;
        }
    }
    return nullptr;
}

const VariantConfig& VariantSelector::defaultVariant() const
{
    return m_variants[m_defaultIndex];
}

} // namespace sr
