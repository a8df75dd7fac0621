#pragma once

#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace sr {

// SimilarityScorer -- how well one candidate matches the query.
//
// Sub-scores are independent and each lies in [0,1]. Missing or malformed
// inputs degrade the affected sub-score to 0 (and mark it not applicable)
// instead of failing the request.
class SimilarityScorer {
public:
    explicit SimilarityScorer(const ScoringConstants& constants = {});

    SimilarityScores score(const QueryContext& query,
                           const ProductCandidate& candidate,
                           const UserContext* user) const;

    // Cosine similarity, or nullopt when either vector is empty, zero-norm
    // or the dimensions differ.
    static std::optional<double> cosineSimilarity(const std::vector<float>& a,
                                                  const std::vector<float>& b);

    // 1 / (1 + e^(-steepness * (cosine - midpoint)))
    double logisticSquash(double cosine) const;

    SubScore visualSimilarity(const std::optional<std::vector<float>>& queryVector,
                              const std::vector<float>& candidateVector) const;
    static SubScore textualSimilarity(const std::optional<QString>& queryText,
                                      const ProductCandidate& candidate);
    static SubScore categoricalSimilarity(const QueryContext& query,
                                          const ProductCandidate& candidate);
    SubScore behavioralSimilarity(const UserContext* user,
                                  const ProductCandidate& candidate) const;

private:
    ScoringConstants m_constants;
};

} // namespace sr
