#include "core/ranking/similarity_scorer.h"
#include "core/ranking/scoring_utils.h"
#include "core/query/query_normalizer.h"
#include "core/shared/logging.h"

#include <QSet>

#include <cmath>

namespace sr {

namespace {

QSet<QString> tokenSet(const QString& text)
{
    const QStringList tokens = QueryNormalizer::tokenize(text);
    return QSet<QString>(tokens.begin(), tokens.end());
}

bool anyTokenIn(const QSet<QString>& needles, const QSet<QString>& haystack)
{
    for (const QString& token : needles) {
        if (haystack.contains(token)) {
            return true;
        }
    }
    return false;
}

} // namespace

SimilarityScorer::SimilarityScorer(const ScoringConstants& constants)
    : m_constants(constants)
{
}

SimilarityScores SimilarityScorer::score(const QueryContext& query,
                                         const ProductCandidate& candidate,
                                         const UserContext* user) const
{
    SimilarityScores scores;
    scores.visual = visualSimilarity(query.vector, candidate.vector);
    scores.textual = textualSimilarity(query.text, candidate);
    scores.categorical = categoricalSimilarity(query, candidate);
    scores.behavioral = behavioralSimilarity(user, candidate);

    LOG_DEBUG(srRanking,
              "similarity: id=%s visual=%.3f textual=%.3f categorical=%.3f behavioral=%.3f",
              qUtf8Printable(candidate.id), scores.visual.value, scores.textual.value,
              scores.categorical.value, scores.behavioral.value);
    return scores;
}

std::optional<double> SimilarityScorer::cosineSimilarity(const std::vector<float>& a,
                                                         const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return std::nullopt;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = static_cast<double>(a[i]);
        const double y = static_cast<double>(b[i]);
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }

    if (!std::isfinite(dot) || normA <= 0.0 || normB <= 0.0
        || !std::isfinite(normA) || !std::isfinite(normB)) {
        return std::nullopt;
    }

    const double cosine = dot / (std::sqrt(normA) * std::sqrt(normB));
    return std::clamp(cosine, -1.0, 1.0);
}

double SimilarityScorer::logisticSquash(double cosine) const
{
    const double z = -m_constants.logisticSteepness * (cosine - m_constants.logisticMidpoint);
    return 1.0 / (1.0 + std::exp(z));
}

SubScore SimilarityScorer::visualSimilarity(const std::optional<std::vector<float>>& queryVector,
                                            const std::vector<float>& candidateVector) const
{
    SubScore sub;
    if (!queryVector.has_value() || queryVector->empty() || candidateVector.empty()) {
        return sub;
    }

    const std::optional<double> cosine = cosineSimilarity(*queryVector, candidateVector);
    if (!cosine.has_value()) {
        LOG_DEBUG(srRanking, "visualSimilarity: unusable vectors (dims %d vs %d)",
                  static_cast<int>(queryVector->size()),
                  static_cast<int>(candidateVector.size()));
        return sub;
    }

    sub.value = clampUnit(logisticSquash(*cosine));
    sub.applicable = true;
    return sub;
}

SubScore SimilarityScorer::textualSimilarity(const std::optional<QString>& queryText,
                                             const ProductCandidate& candidate)
{
    SubScore sub;
    if (!queryText.has_value()) {
        return sub;
    }

    const QSet<QString> queryTokens = tokenSet(*queryText);
    if (queryTokens.isEmpty()) {
        return sub;
    }
    sub.applicable = true;

    const QSet<QString> productTokens =
        tokenSet(candidate.title + QLatin1Char(' ') + candidate.description);

    QSet<QString> unionTokens = queryTokens;
    unionTokens.unite(productTokens);
    QSet<QString> intersection = queryTokens;
    intersection.intersect(productTokens);
    const double jaccard = unionTokens.isEmpty()
        ? 0.0
        : static_cast<double>(intersection.size()) / unionTokens.size();

    const QString normalizedQuery = QueryNormalizer::normalize(*queryText).normalized;
    const QString normalizedTitle = QueryNormalizer::normalize(candidate.title).normalized;
    const double titleBoost =
        (!normalizedQuery.isEmpty() && normalizedTitle.contains(normalizedQuery)) ? 0.3 : 0.0;
    const double brandBoost = anyTokenIn(queryTokens, tokenSet(candidate.brand)) ? 0.2 : 0.0;
    const double categoryBoost =
        anyTokenIn(queryTokens, tokenSet(candidate.category)) ? 0.1 : 0.0;

    sub.value = clampUnit(jaccard + titleBoost + brandBoost + categoryBoost);
    return sub;
}

SubScore SimilarityScorer::categoricalSimilarity(const QueryContext& query,
                                                 const ProductCandidate& candidate)
{
    SubScore sub;

    const QString target = query.targetCategory.value_or(QString()).trimmed();
    const QSet<QString> queryTokens =
        query.text.has_value() ? tokenSet(*query.text) : QSet<QString>();
    if (target.isEmpty() && queryTokens.isEmpty()) {
        return sub;
    }
    sub.applicable = true;

    double score = 0.0;
    if (!target.isEmpty()) {
        if (target.compare(candidate.category, Qt::CaseInsensitive) == 0) {
            score += 0.4;
        }
        if (!candidate.subcategory.isEmpty()
            && target.compare(candidate.subcategory, Qt::CaseInsensitive) == 0) {
            score += 0.3;
        }
    } else {
        if (anyTokenIn(queryTokens, tokenSet(candidate.category))) {
            score += 0.4;
        }
        if (anyTokenIn(queryTokens, tokenSet(candidate.subcategory))) {
            score += 0.3;
        }
    }

    QSet<QString> tagNeedles = queryTokens;
    if (!target.isEmpty()) {
        tagNeedles.unite(tokenSet(target));
    }
    QSet<QString> tagTokens;
    for (const QString& tag : candidate.tags) {
        tagTokens.unite(tokenSet(tag));
    }
    int tagMatches = 0;
    for (const QString& token : tagNeedles) {
        if (tagTokens.contains(token)) {
            ++tagMatches;
        }
    }
    score += std::min(0.3, 0.1 * tagMatches);

    sub.value = clampUnit(score);
    return sub;
}

SubScore SimilarityScorer::behavioralSimilarity(const UserContext* user,
                                                const ProductCandidate& candidate) const
{
    SubScore sub;
    if (!user) {
        return sub;
    }
    sub.applicable = true;

    const QStringList top = topCategories(*user, m_constants.topCategoryCount);
    const double categoryHit = containsIgnoreCase(top, candidate.category) ? 1.0 : 0.0;
    const double loyalty = brandLoyalty(*user, candidate.brand);
    const double priceHit = (user->preferredPriceRange.has_value()
                             && std::isfinite(candidate.price)
                             && user->preferredPriceRange->contains(candidate.price))
        ? 1.0
        : 0.0;

    sub.value = clampUnit(0.4 * categoryHit + 0.3 * loyalty + 0.3 * priceHit);
    return sub;
}

} // namespace sr
