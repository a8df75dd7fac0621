#include "core/ranking/ranking_engine.h"
#include "core/experiment/variant_selector.h"
#include "core/ranking/scoring_utils.h"
#include "core/shared/logging.h"
#include "core/shared/worker_pool.h"

#include <QElapsedTimer>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <utility>

namespace sr {

namespace {

// Weighted mean over the applicable sub-scores; 0 when none applies.
double reduceApplicable(std::initializer_list<std::pair<SubScore, double>> parts)
{
    double weighted = 0.0;
    double totalWeight = 0.0;
    for (const auto& [sub, weight] : parts) {
        if (!sub.applicable || weight <= 0.0) {
            continue;
        }
        weighted += clampUnit(sub.value) * weight;
        totalWeight += weight;
    }
    return totalWeight > 0.0 ? clampUnit(weighted / totalWeight) : 0.0;
}

bool passesPriceFilter(const ProductCandidate& candidate, const QueryContext& query)
{
    if (query.minPrice && !(candidate.price >= *query.minPrice)) {
        return false;
    }
    if (query.maxPrice && !(candidate.price <= *query.maxPrice)) {
        return false;
    }
    return true;
}

constexpr qint64 kUnboundedWaitMs = 24LL * 60 * 60 * 1000;

bool deadlinePassed(qint64 deadlineMs)
{
    return deadlineMs > 0 && QDateTime::currentMSecsSinceEpoch() >= deadlineMs;
}

struct ReasonRule {
    SubScore sub;
    const char* text;
};

// Shared between rank() and the chunk tasks it submits. Tasks that start
// after cancellation touch nothing but this struct.
struct ScoringBatch {
    std::mutex mutex;
    std::condition_variable cv;
    size_t pendingChunks = 0;
    size_t running = 0;
    std::atomic<bool> cancelled{false};
    std::vector<std::optional<ScoreBreakdown>> slots;
};

} // namespace

RankingEngine::RankingEngine(const RankingConfig& config, VariantSelector& selector,
                             WorkerPool* pool)
    : m_config(config)
    , m_selector(selector)
    , m_pool(pool)
    , m_similarity(config.constants)
    , m_business(config.constants)
    , m_personalization(config.constants, config.seasonalCategories)
{
}

CategoryWeights RankingEngine::effectiveWeights(const CategoryWeights& base,
                                                bool hasUser, bool hasGeo,
                                                bool mobile, double mobileFactor)
{
    CategoryWeights w = base;
    w.similarity = std::max(0.0, finiteOr(w.similarity, 0.0));
    w.business = std::max(0.0, finiteOr(w.business, 0.0));
    w.personalization = std::max(0.0, finiteOr(w.personalization, 0.0));
    w.geographic = std::max(0.0, finiteOr(w.geographic, 0.0));

    if (mobile && mobileFactor > 0.0 && std::isfinite(mobileFactor)) {
        w.similarity *= mobileFactor;
    }

    if (!hasUser) {
        w.personalization = 0.0;
    }
    if (!hasGeo) {
        w.geographic = 0.0;
    }

    const double remaining = w.sum();
    if (remaining <= 0.0) {
        // Nothing left to redistribute onto: equal split.
        const int applicable = 2 + (hasUser ? 1 : 0) + (hasGeo ? 1 : 0);
        const double share = 1.0 / applicable;
        CategoryWeights equal;
        equal.similarity = share;
        equal.business = share;
        equal.personalization = hasUser ? share : 0.0;
        equal.geographic = hasGeo ? share : 0.0;
        return equal;
    }

    w.similarity /= remaining;
    w.business /= remaining;
    w.personalization /= remaining;
    w.geographic /= remaining;
    return w;
}

double RankingEngine::similarityCategoryScore(const SimilarityScores& scores,
                                              const SimilarityWeights& weights)
{
    return reduceApplicable({
        {scores.visual, weights.visual},
        {scores.textual, weights.textual},
        {scores.categorical, weights.categorical},
        {scores.behavioral, weights.behavioral},
    });
}

double RankingEngine::businessCategoryScore(const BusinessScores& scores,
                                            const BusinessWeights& weights)
{
    return reduceApplicable({
        {scores.popularity, weights.popularity},
        {scores.stock, weights.stock},
        {scores.price, weights.price},
        {scores.conversion, weights.conversion},
    });
}

double RankingEngine::personalizationCategoryScore(const PersonalizationScores& scores,
                                                   const PersonalizationWeights& weights)
{
    return reduceApplicable({
        {scores.preference, weights.preference},
        {scores.behavioral, weights.behavioral},
        {scores.session, weights.session},
        {scores.temporal, weights.temporal},
    });
}

ScoreBreakdown RankingEngine::scoreCandidate(const ProductCandidate& candidate,
                                             const ScoringInputs& inputs) const
{
    static const QueryContext kEmptyQuery;
    const QueryContext& query = inputs.query ? *inputs.query : kEmptyQuery;

    ScoreBreakdown b;
    b.effectiveWeights = inputs.weights;
    b.similarityDetail = m_similarity.score(query, candidate, inputs.user);
    b.businessDetail = m_business.score(candidate, inputs.geo);
    b.personalizationDetail = m_personalization.score(candidate, inputs.user, query,
                                                      inputs.requestTime);

    b.similarity = similarityCategoryScore(b.similarityDetail, m_config.similarityWeights);
    b.business = businessCategoryScore(b.businessDetail, m_config.businessWeights);
    b.personalization = personalizationCategoryScore(b.personalizationDetail,
                                                     m_config.personalizationWeights);
    b.geographic = b.businessDetail.geographic.applicable
        ? clampUnit(b.businessDetail.geographic.value)
        : 0.0;

    b.finalScore = clampUnit(inputs.weights.similarity * b.similarity
                             + inputs.weights.business * b.business
                             + inputs.weights.personalization * b.personalization
                             + inputs.weights.geographic * b.geographic);
    b.reasons = buildReasons(b);
    return b;
}

std::vector<QString> RankingEngine::buildReasons(const ScoreBreakdown& breakdown) const
{
    const double threshold = m_config.constants.reasonThreshold;
    const size_t maxReasons = static_cast<size_t>(std::max(0, m_config.constants.maxReasons));
    const CategoryWeights& w = breakdown.effectiveWeights;

    std::vector<ReasonRule> rules;
    if (w.similarity > 0.0) {
        const SimilarityScores& s = breakdown.similarityDetail;
        rules.push_back({s.visual, "visually similar"});
        rules.push_back({s.textual, "title matches query"});
        rules.push_back({s.categorical, "matches requested category"});
        rules.push_back({s.behavioral, "matches your shopping history"});
    }
    if (w.business > 0.0) {
        const BusinessScores& s = breakdown.businessDetail;
        rules.push_back({s.popularity, "popular and highly rated"});
        rules.push_back({s.stock, "in stock"});
        rules.push_back({s.price, "competitively priced"});
        rules.push_back({s.conversion, "frequently purchased"});
    }
    if (w.geographic > 0.0) {
        rules.push_back({breakdown.businessDetail.geographic, "available in your region"});
    }
    if (w.personalization > 0.0) {
        const PersonalizationScores& s = breakdown.personalizationDetail;
        rules.push_back({s.preference, "matches your preferences"});
        rules.push_back({s.behavioral, "similar to items you viewed"});
        rules.push_back({s.session, "fits your current search"});
        rules.push_back({s.temporal, "seasonal or trending pick"});
    }

    std::vector<QString> reasons;
    for (const auto& rule : rules) {
        if (reasons.size() >= maxReasons) {
            break;
        }
        if (rule.sub.applicable && rule.sub.value > threshold) {
            reasons.push_back(QString::fromLatin1(rule.text));
        }
    }
    return reasons;
}

qint64 RankingEngine::resolveDeadline(const RankRequest& request) const
{
    if (request.deadlineMs > 0) {
        return request.deadlineMs;
    }
    if (m_config.defaultTimeoutMs > 0) {
        return QDateTime::currentMSecsSinceEpoch() + m_config.defaultTimeoutMs;
    }
    return 0;
}

bool RankingEngine::scoreAll(const std::vector<const ProductCandidate*>& candidates,
                             const ScoringInputs& inputs,
                             qint64 deadlineMs,
                             std::vector<std::optional<ScoreBreakdown>>& slots) const
{
    const size_t n = candidates.size();
    slots.assign(n, std::nullopt);
    if (n == 0) {
        return true;
    }
    if (deadlinePassed(deadlineMs)) {
        return false;
    }

    if (!m_pool || n == 1) {
        for (size_t i = 0; i < n; ++i) {
            if (deadlinePassed(deadlineMs)) {
                return false;
            }
            slots[i] = scoreCandidate(*candidates[i], inputs);
        }
        return true;
    }

    auto batch = std::make_shared<ScoringBatch>();
    batch->slots.resize(n);

    const size_t threads = std::max<size_t>(1, m_pool->threadCount());
    const size_t chunkCount = threads * 4;
    const size_t chunkSize = std::max<size_t>(1, (n + chunkCount - 1) / chunkCount);

    std::vector<std::pair<size_t, size_t>> ranges;
    for (size_t begin = 0; begin < n; begin += chunkSize) {
        ranges.emplace_back(begin, std::min(n, begin + chunkSize));
    }
    batch->pendingChunks = ranges.size();

    for (const auto& range : ranges) {
        auto task = [this, batch, range, &candidates, &inputs]() {
            {
                std::lock_guard<std::mutex> lock(batch->mutex);
                if (batch->cancelled.load()) {
                    --batch->pendingChunks;
                    batch->cv.notify_all();
                    return;
                }
                ++batch->running;
            }
            for (size_t i = range.first; i < range.second; ++i) {
                if (batch->cancelled.load()) {
                    break;
                }
                ScoreBreakdown breakdown = scoreCandidate(*candidates[i], inputs);
                std::lock_guard<std::mutex> lock(batch->mutex);
                batch->slots[i] = std::move(breakdown);
            }
            std::lock_guard<std::mutex> lock(batch->mutex);
            --batch->running;
            --batch->pendingChunks;
            batch->cv.notify_all();
        };
        if (!m_pool->submit(task)) {
            task();
        }
    }

    std::unique_lock<std::mutex> lock(batch->mutex);
    const auto allDone = [&batch] { return batch->pendingChunks == 0; };
    bool complete = true;
    const qint64 remaining = deadlineMs > 0
        ? std::max<qint64>(0, deadlineMs - QDateTime::currentMSecsSinceEpoch())
        : 0;
    // Deadlines further out than a day are treated as unbounded.
    if (deadlineMs > 0 && remaining < kUnboundedWaitMs) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(remaining);
        complete = batch->cv.wait_until(lock, until, allDone);
    } else {
        batch->cv.wait(lock, allDone);
    }

    if (!complete) {
        batch->cancelled.store(true);
        batch->cv.wait(lock, [&batch] { return batch->running == 0; });
    }

    slots = std::move(batch->slots);
    batch->slots.clear();
    return std::all_of(slots.begin(), slots.end(),
                       [](const std::optional<ScoreBreakdown>& slot) { return slot.has_value(); });
}

std::optional<RankResponse> RankingEngine::rank(const RankRequest& request, QString* errorOut)
{
    if (!request.query) {
        if (errorOut) {
            *errorOut = QStringLiteral("ranking request has no query context");
        }
        LOG_WARN(srRanking, "Rejecting ranking request without query context");
        return std::nullopt;
    }

    if (!request.variantName.isEmpty()) {
        if (const VariantConfig* named = m_selector.variant(request.variantName)) {
            return rankWithVariant(request, *named, errorOut);
        }
        LOG_WARN(srRanking, "Unknown variant '%s' requested; using assignment",
                 qUtf8Printable(request.variantName));
    }

    const QString userId = request.user ? request.user->userId : QString();
    const VariantConfig& assigned = m_selector.assignAndRecord(request.sessionId, userId);
    return rankWithVariant(request, assigned, errorOut);
}

std::optional<RankResponse> RankingEngine::rankWithVariant(const RankRequest& request,
                                                           const VariantConfig& variant,
                                                           QString* errorOut) const
{
    QElapsedTimer timer;
    timer.start();

    if (!request.query) {
        if (errorOut) {
            *errorOut = QStringLiteral("ranking request has no query context");
        }
        return std::nullopt;
    }

    const QDateTime requestTime = request.requestTime.isValid()
        ? request.requestTime.toUTC()
        : QDateTime::currentDateTimeUtc();

    // Request-level device type overrides the profile's.
    std::optional<UserContext> user = request.user;
    if (user && !request.deviceType.isEmpty()) {
        user->deviceType = request.deviceType;
    }
    const QString deviceType = !request.deviceType.isEmpty()
        ? request.deviceType
        : (user ? user->deviceType : QString());
    const bool mobile = deviceType.trimmed().compare(QLatin1String("mobile"),
                                                     Qt::CaseInsensitive) == 0;

    ScoringInputs inputs;
    inputs.query = &*request.query;
    inputs.user = user ? &*user : nullptr;
    inputs.geo = request.geo ? &*request.geo : nullptr;
    inputs.weights = effectiveWeights(variant.weights, user.has_value(), request.geo.has_value(),
                                      mobile, m_config.constants.mobileSimilarityFactor);
    inputs.requestTime = requestTime;

    RankResponse response;
    response.variantName = variant.name;
    response.effectiveWeights = inputs.weights;
    response.personalized = user.has_value();
    response.geographic = request.geo.has_value();
    response.totalCandidates = static_cast<int>(request.candidates.size());
    response.invalidCount = request.invalidCount;

    std::vector<const ProductCandidate*> eligible;
    eligible.reserve(request.candidates.size());
    for (const auto& candidate : request.candidates) {
        if (passesPriceFilter(candidate, *request.query)) {
            eligible.push_back(&candidate);
        } else {
            ++response.filteredCount;
        }
    }

    std::vector<std::optional<ScoreBreakdown>> slots;
    const bool complete = scoreAll(eligible, inputs, resolveDeadline(request), slots);

    response.results.reserve(eligible.size());
    for (size_t i = 0; i < eligible.size(); ++i) {
        if (!slots[i]) {
            ++response.droppedCount;
            continue;
        }
        RankedCandidate ranked;
        ranked.candidate = *eligible[i];
        ranked.finalScore = slots[i]->finalScore;
        ranked.breakdown = std::move(*slots[i]);
        response.results.push_back(std::move(ranked));
    }
    response.timedOut = !complete;

    std::stable_sort(response.results.begin(), response.results.end(),
                     [](const RankedCandidate& a, const RankedCandidate& b) {
                         if (a.finalScore != b.finalScore) {
                             return a.finalScore > b.finalScore; // Descending
                         }
                         return a.candidate.id < b.candidate.id; // Ascending (tie-break)
                     });

    if (request.limit > 0 && response.results.size() > static_cast<size_t>(request.limit)) {
        response.results.resize(static_cast<size_t>(request.limit));
    }
    for (size_t i = 0; i < response.results.size(); ++i) {
        response.results[i].rank = static_cast<int>(i) + 1;
    }

    response.processingTimeMs = timer.elapsed();
    if (response.timedOut) {
        LOG_WARN(srRanking, "rank: deadline expired, %d of %d candidate(s) dropped",
                 response.droppedCount, static_cast<int>(eligible.size()));
    }
    LOG_DEBUG(srRanking, "rank: variant=%s ranked %zu result(s) in %lld ms",
              qUtf8Printable(variant.name), response.results.size(),
              static_cast<long long>(response.processingTimeMs));
    return response;
}

} // namespace sr
