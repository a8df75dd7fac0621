#include "core/ranking/business_scorer.h"
#include "core/ranking/scoring_utils.h"
#include "core/shared/logging.h"

#include <cmath>

namespace sr {

namespace {

double cappedRatio(double value, double cap)
{
    if (!std::isfinite(value) || value <= 0.0) {
        return 0.0;
    }
    return std::min(1.0, value / cap);
}

} // namespace

BusinessScorer::BusinessScorer(const ScoringConstants& constants)
    : m_constants(constants)
{
}

BusinessScores BusinessScorer::score(const ProductCandidate& candidate,
                                     const GeoContext* geo) const
{
    BusinessScores scores;
    scores.popularity = {popularityScore(candidate), true};
    scores.stock = {stockScore(candidate), true};
    scores.price = {priceScore(candidate), true};
    scores.conversion = {conversionScore(candidate), true};
    scores.geographic = geographicScore(candidate, geo);

    LOG_DEBUG(srRanking,
              "business: id=%s popularity=%.3f stock=%.3f price=%.3f conversion=%.3f geo=%.3f",
              qUtf8Printable(candidate.id), scores.popularity.value, scores.stock.value,
              scores.price.value, scores.conversion.value, scores.geographic.value);
    return scores;
}

double BusinessScorer::popularityScore(const ProductCandidate& candidate) const
{
    const double popularity = clampUnit(candidate.popularityScore);
    const double views = cappedRatio(static_cast<double>(candidate.viewCount), m_constants.viewsCap);
    const double purchases =
        cappedRatio(static_cast<double>(candidate.purchaseCount), m_constants.purchasesCap);
    const double rating = cappedRatio(candidate.rating, m_constants.ratingScale);
    const double reviews =
        cappedRatio(static_cast<double>(candidate.reviewCount), m_constants.reviewsCap);

    return clampUnit(popularity * 0.30
                     + views * 0.20
                     + purchases * 0.30
                     + rating * 0.15
                     + reviews * 0.05);
}

double BusinessScorer::stockScore(const ProductCandidate& candidate)
{
    const int quantity = candidate.stockQuantity;

    if (quantity <= 0 && candidate.backorderable) {
        return 0.2;
    }
    if (!candidate.inStock || quantity <= 0) {
        return 0.1;
    }
    if (quantity > 50) {
        return 1.0;
    }
    if (quantity >= 10) {
        return 0.8;
    }
    return 0.6;
}

double BusinessScorer::priceScore(const ProductCandidate& candidate)
{
    const double price = finiteOr(candidate.price, 0.0);
    const double original = finiteOr(candidate.originalPrice, 0.0);
    const double categoryAvg = finiteOr(candidate.categoryAvgPrice, 0.0);

    double discount = 0.0;
    if (original > 0.0 && original > price && price >= 0.0) {
        discount = (original - price) / original;
    }

    // 0.7 at the category average, moving by up to 0.3 per 100% deviation.
    double competitiveness = 0.5;
    if (categoryAvg > 0.0 && price > 0.0) {
        const double deviation = (categoryAvg - price) / categoryAvg;
        competitiveness = 0.7 + deviation * 0.3;
    }

    return clampUnit(competitiveness + discount * 0.3);
}

double BusinessScorer::conversionScore(const ProductCandidate& candidate) const
{
    double conversionRate = 0.0;
    if (candidate.conversionRate.has_value()) {
        conversionRate = *candidate.conversionRate;
    } else if (candidate.viewCount > 0) {
        conversionRate = static_cast<double>(candidate.purchaseCount) / candidate.viewCount;
    }

    const double addToCartRate = candidate.addToCartRate.value_or(0.0);

    double returnRate = 0.0;
    if (candidate.returnRate.has_value()) {
        returnRate = *candidate.returnRate;
    } else if (candidate.purchaseCount > 0) {
        returnRate = static_cast<double>(candidate.returnCount) / candidate.purchaseCount;
    }
    returnRate = std::max(0.0, finiteOr(returnRate, 0.0));

    const double normalizedConversion = cappedRatio(conversionRate, m_constants.conversionRateCap);
    const double normalizedCart = cappedRatio(addToCartRate, m_constants.addToCartRateCap);
    const double returnPenalty = std::max(0.0, 1.0 - returnRate / m_constants.returnRateCap);

    return clampUnit(normalizedConversion * 0.5 + normalizedCart * 0.3 + returnPenalty * 0.2);
}

SubScore BusinessScorer::geographicScore(const ProductCandidate& candidate,
                                         const GeoContext* geo) const
{
    SubScore sub;
    if (!geo) {
        return sub;
    }
    sub.applicable = true;

    double score = 0.0;
    if (containsIgnoreCase(candidate.availableRegions, geo->country)
        || containsIgnoreCase(candidate.availableRegions, geo->region)) {
        score += 0.3;
    }
    if (candidate.shippingCost.has_value() && std::isfinite(*candidate.shippingCost)) {
        score += 0.1 * std::max(0.0, 1.0 - *candidate.shippingCost / m_constants.shippingCostCap);
    }
    if (candidate.shippingDays.has_value() && std::isfinite(*candidate.shippingDays)) {
        score += 0.1 * std::max(0.0, 1.0 - *candidate.shippingDays / m_constants.shippingDaysCap);
    }
    if (const auto local = lookupIgnoreCase(candidate.regionalPopularity, geo->country)) {
        score += 0.1 * clampUnit(*local);
    }

    sub.value = clampUnit(score);
    return sub;
}

} // namespace sr
