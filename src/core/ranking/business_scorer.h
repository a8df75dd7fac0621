#pragma once

#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

namespace sr {

// BusinessScorer -- commerce value of one candidate, independent of the query.
class BusinessScorer {
public:
    explicit BusinessScorer(const ScoringConstants& constants = {});

    BusinessScores score(const ProductCandidate& candidate, const GeoContext* geo) const;

    double popularityScore(const ProductCandidate& candidate) const;

    // Step function over stock level; never returns 0 so zero-stock items
    // can still surface if nothing better exists.
    static double stockScore(const ProductCandidate& candidate);

    static double priceScore(const ProductCandidate& candidate);
    double conversionScore(const ProductCandidate& candidate) const;

    // Not applicable without a GeoContext.
    SubScore geographicScore(const ProductCandidate& candidate, const GeoContext* geo) const;

private:
    ScoringConstants m_constants;
};

} // namespace sr
