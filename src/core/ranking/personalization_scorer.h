#pragma once

#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <vector>

namespace sr {

// PersonalizationScorer -- alignment of one candidate with a known user.
//
// Returns all-zero, not-applicable scores without a UserContext. The request
// time is an input so that scoring never reads the wall clock.
class PersonalizationScorer {
public:
    explicit PersonalizationScorer(const ScoringConstants& constants = {},
                                   std::vector<SeasonalCategory> seasons = {});

    PersonalizationScores score(const ProductCandidate& candidate,
                                const UserContext* user,
                                const QueryContext& query,
                                const QDateTime& requestTime) const;

    // 0.4 category match + 0.3 brand loyalty + 0.3 price-band match
    double preferenceScore(const ProductCandidate& candidate, const UserContext& user) const;
    double behavioralScore(const ProductCandidate& candidate, const UserContext& user,
                           int hour) const;
    double sessionScore(const ProductCandidate& candidate, const UserContext& user,
                        SearchIntent intent, int hour) const;
    double temporalScore(const ProductCandidate& candidate, int month) const;

    static double intentMatch(const ProductCandidate& candidate, SearchIntent intent);
    static double deviceFit(const ProductCandidate& candidate, const QString& deviceType);
    static double timeOfDayFit(const ProductCandidate& candidate, int hour);

    // Explicit intent wins; otherwise inferred from the query text.
    static SearchIntent resolveIntent(const QueryContext& query);

private:
    double priceBandMatch(const ProductCandidate& candidate, const UserContext& user) const;

    ScoringConstants m_constants;
    std::vector<SeasonalCategory> m_seasons;
};

} // namespace sr
