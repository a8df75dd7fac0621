#pragma once

#include "core/ranking/business_scorer.h"
#include "core/ranking/personalization_scorer.h"
#include "core/ranking/similarity_scorer.h"
#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

namespace sr {

class VariantSelector;
class WorkerPool;

struct RankRequest {
    std::optional<QueryContext> query;   // required
    std::vector<ProductCandidate> candidates;
    std::optional<UserContext> user;
    std::optional<GeoContext> geo;

    QString sessionId;
    QString deviceType;     // overrides user->deviceType when set
    QString variantName;    // empty = selector assignment
    QDateTime requestTime;  // invalid = now (UTC)
    qint64 deadlineMs = 0;  // absolute, ms since epoch; 0 = config default
    int limit = 0;          // 0 = no limit
    int invalidCount = 0;   // candidates skipped while decoding
};

// Per-request inputs shared by every candidate's scoring.
struct ScoringInputs {
    const QueryContext* query = nullptr;
    const UserContext* user = nullptr;   // device type already resolved
    const GeoContext* geo = nullptr;
    CategoryWeights weights;             // effective weights
    QDateTime requestTime;
};

struct RankResponse {
    QString variantName;
    std::vector<RankedCandidate> results;
    CategoryWeights effectiveWeights;
    bool personalized = false;
    bool geographic = false;

    bool timedOut = false;
    int droppedCount = 0;    // left unscored when the deadline expired
    int filteredCount = 0;   // removed by the price filter
    int totalCandidates = 0;
    int invalidCount = 0;    // skipped while decoding, not in totalCandidates
    qint64 processingTimeMs = 0;
};

// RankingEngine -- scores every candidate with the three scorers, combines
// the category scores with the variant's weights and sorts by
// (finalScore DESC, id ASC).
//
// Holds no mutable state across calls apart from the selector it was given.
// When a WorkerPool is supplied, candidates are scored in parallel chunks.
class RankingEngine {
public:
    RankingEngine(const RankingConfig& config, VariantSelector& selector,
                  WorkerPool* pool = nullptr);

    // Resolves the variant (explicit name, else sticky selector assignment)
    // and ranks. Fails only when the request carries no QueryContext.
    std::optional<RankResponse> rank(const RankRequest& request, QString* errorOut = nullptr);

    std::optional<RankResponse> rankWithVariant(const RankRequest& request,
                                                const VariantConfig& variant,
                                                QString* errorOut = nullptr) const;

    ScoreBreakdown scoreCandidate(const ProductCandidate& candidate,
                                  const ScoringInputs& inputs) const;

    // Applies the mobile similarity factor, then hands the weight of the
    // inapplicable categories to the others in proportion. Sums to 1.
    static CategoryWeights effectiveWeights(const CategoryWeights& base,
                                            bool hasUser, bool hasGeo,
                                            bool mobile, double mobileFactor);

    static double similarityCategoryScore(const SimilarityScores& scores,
                                          const SimilarityWeights& weights);
    static double businessCategoryScore(const BusinessScores& scores,
                                        const BusinessWeights& weights);
    static double personalizationCategoryScore(const PersonalizationScores& scores,
                                               const PersonalizationWeights& weights);

    std::vector<QString> buildReasons(const ScoreBreakdown& breakdown) const;

    const RankingConfig& config() const { return m_config; }

private:
    qint64 resolveDeadline(const RankRequest& request) const;

    // Fills slots[i] for each scored candidate; unscored slots stay empty.
    // Returns false when the deadline cut scoring short. Must not be called
    // from one of the pool's own threads.
    bool scoreAll(const std::vector<const ProductCandidate*>& candidates,
                  const ScoringInputs& inputs,
                  qint64 deadlineMs,
                  std::vector<std::optional<ScoreBreakdown>>& slots) const;

    RankingConfig m_config;
    VariantSelector& m_selector;
    WorkerPool* m_pool = nullptr;

    SimilarityScorer m_similarity;
    BusinessScorer m_business;
    PersonalizationScorer m_personalization;
};

} // namespace sr
