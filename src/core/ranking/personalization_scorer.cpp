#include "core/ranking/personalization_scorer.h"
#include "core/ranking/scoring_utils.h"
#include "core/query/intent_classifier.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace sr {

namespace {

constexpr double kDefaultAveragePrice = 100.0;

double categoryMatch(const ProductCandidate& candidate, const UserContext& user)
{
    if (const auto preference = lookupIgnoreCase(user.categoryPreferences, candidate.category)) {
        return clampUnit(*preference);
    }

    int maxCount = 0;
    for (int count : user.categoryFrequency) {
        maxCount = std::max(maxCount, count);
    }
    if (maxCount <= 0) {
        return 0.0;
    }
    const int count = lookupIgnoreCase(user.categoryFrequency, candidate.category).value_or(0);
    return clampUnit(static_cast<double>(std::max(0, count)) / maxCount);
}

} // namespace

PersonalizationScorer::PersonalizationScorer(const ScoringConstants& constants,
                                             std::vector<SeasonalCategory> seasons)
    : m_constants(constants)
    , m_seasons(std::move(seasons))
{
}

SearchIntent PersonalizationScorer::resolveIntent(const QueryContext& query)
{
    if (query.intent.has_value()) {
        return *query.intent;
    }
    if (query.text.has_value()) {
        return IntentClassifier::classify(*query.text).value_or(SearchIntent::Unknown);
    }
    return SearchIntent::Unknown;
}

PersonalizationScores PersonalizationScorer::score(const ProductCandidate& candidate,
                                                   const UserContext* user,
                                                   const QueryContext& query,
                                                   const QDateTime& requestTime) const
{
    PersonalizationScores scores;
    if (!user) {
        return scores;
    }

    int hour = -1;
    if (user->hourOfDay.has_value()) {
        hour = *user->hourOfDay;
    } else if (requestTime.isValid()) {
        hour = requestTime.time().hour();
    }
    const int month = requestTime.isValid() ? requestTime.date().month() : 0;

    scores.preference = {preferenceScore(candidate, *user), true};
    scores.behavioral = {behavioralScore(candidate, *user, hour), true};
    scores.session = {sessionScore(candidate, *user, resolveIntent(query), hour), true};
    scores.temporal = {temporalScore(candidate, month), true};

    LOG_DEBUG(srRanking,
              "personalization: id=%s user=%s preference=%.3f behavioral=%.3f "
              "session=%.3f temporal=%.3f",
              qUtf8Printable(candidate.id), qUtf8Printable(user->userId),
              scores.preference.value, scores.behavioral.value,
              scores.session.value, scores.temporal.value);
    return scores;
}

double PersonalizationScorer::priceBandMatch(const ProductCandidate& candidate,
                                             const UserContext& user) const
{
    const double price = finiteOr(candidate.price, 0.0);

    if (user.preferredPriceRange.has_value()) {
        const PriceRange& band = *user.preferredPriceRange;
        if (band.contains(price)) {
            return 1.0;
        }
        const double width = std::max(band.max - band.min, 1.0);
        const double distance = price < band.min ? band.min - price : price - band.max;
        return clampUnit(1.0 / (1.0 + distance / width));
    }

    if (user.priceSensitivity > m_constants.priceSensitiveThreshold) {
        const double average = user.averagePurchasePrice > 0.0
            ? user.averagePurchasePrice
            : kDefaultAveragePrice;
        const double ratio = price / average;
        return ratio <= 1.0 ? 1.0 : clampUnit(1.0 / ratio);
    }
    return 0.8;
}

double PersonalizationScorer::preferenceScore(const ProductCandidate& candidate,
                                              const UserContext& user) const
{
    return clampUnit(0.4 * categoryMatch(candidate, user)
                     + 0.3 * brandLoyalty(user, candidate.brand)
                     + 0.3 * priceBandMatch(candidate, user));
}

double PersonalizationScorer::behavioralScore(const ProductCandidate& candidate,
                                              const UserContext& user, int hour) const
{
    double score = 0.0;

    // Purchase-timing regularity
    if (hour >= 0
        && std::find(user.preferredPurchaseHours.begin(), user.preferredPurchaseHours.end(),
                     hour) != user.preferredPurchaseHours.end()) {
        score += 0.2;
    }

    if (!candidate.id.isEmpty() && user.viewedProductIds.contains(candidate.id)) {
        score += 0.3;
    }

    // Past interactions with similar items
    const int interactions =
        lookupIgnoreCase(user.categoryFrequency, candidate.category).value_or(0);
    if (interactions > 0) {
        score += std::min(0.5, 0.1 * interactions);
    }

    return clampUnit(score);
}

double PersonalizationScorer::intentMatch(const ProductCandidate& candidate, SearchIntent intent)
{
    switch (intent) {
    case SearchIntent::Purchase:
        return (candidate.inStock && candidate.stockQuantity > 0) ? 0.8 : 0.2;
    case SearchIntent::Browse:
        return 0.7;
    case SearchIntent::Research:
        return candidate.reviewCount > 10 ? 0.6 : 0.4;
    case SearchIntent::Compare:
        return candidate.hasSpecifications ? 0.8 : 0.5;
    case SearchIntent::Unknown:
        return 0.5;
    }
    return 0.5;
}

double PersonalizationScorer::deviceFit(const ProductCandidate& candidate,
                                        const QString& deviceType)
{
    const QString device = deviceType.trimmed().toLower();
    if (device == QLatin1String("mobile")) {
        return candidate.price < 100.0 ? 0.8 : 0.6;
    }
    if (device == QLatin1String("desktop")) {
        return candidate.hasSpecifications ? 0.8 : 0.6;
    }
    return 0.7;
}

double PersonalizationScorer::timeOfDayFit(const ProductCandidate& candidate, int hour)
{
    const QString category = candidate.category.toLower();
    if (hour >= 9 && hour <= 17) {
        return category == QLatin1String("business") ? 0.8 : 0.6;
    }
    if (hour >= 18 && hour <= 22) {
        return (category == QLatin1String("entertainment") || category == QLatin1String("home"))
            ? 0.8
            : 0.6;
    }
    return 0.5;
}

double PersonalizationScorer::sessionScore(const ProductCandidate& candidate,
                                           const UserContext& user,
                                           SearchIntent intent, int hour) const
{
    return clampUnit(0.4 * intentMatch(candidate, intent)
                     + 0.3 * deviceFit(candidate, user.deviceType)
                     + 0.3 * timeOfDayFit(candidate, hour));
}

double PersonalizationScorer::temporalScore(const ProductCandidate& candidate, int month) const
{
    double score = 0.5;

    const QString category = candidate.category.toLower();
    if (month >= 1 && month <= 12 && !category.isEmpty()) {
        for (const SeasonalCategory& season : m_seasons) {
            if (category.contains(season.keyword, Qt::CaseInsensitive)
                && std::find(season.months.begin(), season.months.end(), month)
                       != season.months.end()) {
                score += 0.3;
                break;
            }
        }
    }

    if (candidate.isTrending) {
        score += 0.2;
    }
    return clampUnit(score);
}

} // namespace sr
