#pragma once

#include "core/shared/ranking_config.h"

#include <QString>

#include <vector>

namespace sr {

class ExperimentStore;

// VariantSelector -- deterministic A/B bucketing of a session or user id.
//
// SHA-256(id) is reduced into kBucketCount buckets, which are mapped onto the
// variants' cumulative traffic shares. For a fixed configuration the same id
// always lands in the same variant. The configuration must pass
// RankingConfig::validate().
class VariantSelector {
public:
    static constexpr int kBucketCount = 10000;

    explicit VariantSelector(const RankingConfig& config, ExperimentStore* store = nullptr);

    // Pure assignment. An empty id gets the default variant.
    const VariantConfig& assign(const QString& id) const;

    // Sticky assignment: returns the variant already recorded for the session
    // when it is still configured, otherwise assigns (by userId when present,
    // else sessionId) and records the result for the session.
    const VariantConfig& assignAndRecord(const QString& sessionId,
                                         const QString& userId = {});

    const VariantConfig* variant(const QString& name) const;
    const VariantConfig& defaultVariant() const;
    const std::vector<VariantConfig>& variants() const { return m_variants; }

    static int bucketFor(const QString& id);

private:
    std::vector<VariantConfig> m_variants;
    std::vector<int> m_upperBounds;  // exclusive, parallel to m_variants
    size_t m_defaultIndex = 0;
    ExperimentStore* m_store = nullptr;
};

} // namespace sr
