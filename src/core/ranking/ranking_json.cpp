#include "core/ranking/ranking_json.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonValue>

#include <algorithm>
#include <cmath>
#include <limits>

namespace sr {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

bool readOptionalDouble(const QJsonObject& obj, const QString& key,
                        std::optional<double>* target, QString* errorOut)
{
    if (!obj.contains(key) || obj.value(key).isNull()) {
        return true;
    }
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        setError(errorOut, QStringLiteral("'%1' must be a number").arg(key));
        return false;
    }
    *target = value.toDouble();
    return true;
}

bool readDouble(const QJsonObject& obj, const QString& key, double* target, QString* errorOut)
{
    std::optional<double> value;
    if (!readOptionalDouble(obj, key, &value, errorOut)) {
        return false;
    }
    if (value) {
        *target = *value;
    }
    return true;
}

bool readVector(const QJsonObject& obj, const QString& key, std::vector<float>* target,
                QString* errorOut)
{
    if (!obj.contains(key) || obj.value(key).isNull()) {
        return true;
    }
    if (!obj.value(key).isArray()) {
        setError(errorOut, QStringLiteral("'%1' must be an array of numbers").arg(key));
        return false;
    }
    const QJsonArray array = obj.value(key).toArray();
    target->clear();
    target->reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& v : array) {
        if (!v.isDouble()) {
            setError(errorOut, QStringLiteral("'%1' must be an array of numbers").arg(key));
            return false;
        }
        target->push_back(static_cast<float>(v.toDouble()));
    }
    return true;
}

// Saturates at the qint64 range; non-numbers yield fallback.
qint64 readClampedInt64(const QJsonValue& value, qint64 fallback)
{
    if (!value.isDouble()) {
        return fallback;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw)) {
        return fallback;
    }
    const double limit = static_cast<double>(std::numeric_limits<qint64>::max());
    if (raw >= limit) {
        return std::numeric_limits<qint64>::max();
    }
    if (raw <= -limit) {
        return std::numeric_limits<qint64>::min();
    }
    return static_cast<qint64>(raw);
}

void warnCandidateField(const QString& id, const QString& problem)
{
    LOG_WARN(srRanking, "Candidate '%s': %s; field ignored",
             qUtf8Printable(id), qUtf8Printable(problem));
}

// Candidate fields degrade rather than fail: a wrong-typed value keeps the
// field's default and is logged.
void readCandidateDouble(const QJsonObject& obj, const QString& id, const QString& key,
                         double* target)
{
    QString error;
    if (!readDouble(obj, key, target, &error)) {
        warnCandidateField(id, error);
    }
}

void readCandidateOptional(const QJsonObject& obj, const QString& id, const QString& key,
                           std::optional<double>* target)
{
    QString error;
    if (!readOptionalDouble(obj, key, target, &error)) {
        warnCandidateField(id, error);
        target->reset();
    }
}

qint64 readCandidateCount(const QJsonObject& obj, const QString& id, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isUndefined() && !value.isNull() && !value.isDouble()) {
        warnCandidateField(id, QStringLiteral("'%1' must be a number").arg(key));
    }
    return std::max<qint64>(0, readClampedInt64(value, 0));
}

QStringList readStringList(const QJsonObject& obj, const QString& key)
{
    QStringList out;
    for (const QJsonValue& v : obj.value(key).toArray()) {
        if (v.isString()) {
            out.append(v.toString());
        }
    }
    return out;
}

QHash<QString, double> readDoubleMap(const QJsonObject& obj, const QString& key)
{
    QHash<QString, double> out;
    const QJsonObject map = obj.value(key).toObject();
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (it.value().isDouble()) {
            out.insert(it.key(), it.value().toDouble());
        }
    }
    return out;
}

QHash<QString, int> readIntMap(const QJsonObject& obj, const QString& key)
{
    QHash<QString, int> out;
    const QJsonObject map = obj.value(key).toObject();
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (it.value().isDouble()) {
            out.insert(it.key(), it.value().toInt());
        }
    }
    return out;
}

std::optional<QueryContext> parseQuery(const QJsonObject& obj, QString* errorOut)
{
    QueryContext query;
    if (obj.value(QStringLiteral("text")).isString()) {
        query.text = obj.value(QStringLiteral("text")).toString();
    }
    if (obj.contains(QStringLiteral("vector"))) {
        std::vector<float> vector;
        if (!readVector(obj, QStringLiteral("vector"), &vector, errorOut)) {
            return std::nullopt;
        }
        query.vector = std::move(vector);
    }
    if (obj.value(QStringLiteral("targetCategory")).isString()) {
        query.targetCategory = obj.value(QStringLiteral("targetCategory")).toString();
    }
    if (!readOptionalDouble(obj, QStringLiteral("minPrice"), &query.minPrice, errorOut)
        || !readOptionalDouble(obj, QStringLiteral("maxPrice"), &query.maxPrice, errorOut)) {
        return std::nullopt;
    }
    if (obj.value(QStringLiteral("intent")).isString()) {
        query.intent = searchIntentFromString(obj.value(QStringLiteral("intent")).toString());
    }
    return query;
}

// Returns nullopt only for a candidate without an id.
std::optional<ProductCandidate> parseCandidate(const QJsonObject& obj)
{
    ProductCandidate c;
    c.id = obj.value(QStringLiteral("id")).toString();
    if (c.id.isEmpty()) {
        return std::nullopt;
    }

    QString error;
    if (!readVector(obj, QStringLiteral("vector"), &c.vector, &error)) {
        warnCandidateField(c.id, error);
        c.vector.clear();
    }

    c.title = obj.value(QStringLiteral("title")).toString();
    c.description = obj.value(QStringLiteral("description")).toString();
    c.brand = obj.value(QStringLiteral("brand")).toString();
    c.category = obj.value(QStringLiteral("category")).toString();
    c.subcategory = obj.value(QStringLiteral("subcategory")).toString();
    c.tags = readStringList(obj, QStringLiteral("tags"));

    readCandidateDouble(obj, c.id, QStringLiteral("price"), &c.price);
    readCandidateDouble(obj, c.id, QStringLiteral("originalPrice"), &c.originalPrice);
    readCandidateDouble(obj, c.id, QStringLiteral("categoryAvgPrice"), &c.categoryAvgPrice);
    readCandidateDouble(obj, c.id, QStringLiteral("popularityScore"), &c.popularityScore);
    readCandidateDouble(obj, c.id, QStringLiteral("rating"), &c.rating);
    readCandidateOptional(obj, c.id, QStringLiteral("conversionRate"), &c.conversionRate);
    readCandidateOptional(obj, c.id, QStringLiteral("addToCartRate"), &c.addToCartRate);
    readCandidateOptional(obj, c.id, QStringLiteral("returnRate"), &c.returnRate);
    readCandidateOptional(obj, c.id, QStringLiteral("shippingCost"), &c.shippingCost);
    readCandidateOptional(obj, c.id, QStringLiteral("shippingDays"), &c.shippingDays);

    c.stockQuantity = obj.value(QStringLiteral("stockQuantity")).toInt(0);
    c.inStock = obj.value(QStringLiteral("inStock")).toBool(true);
    c.backorderable = obj.value(QStringLiteral("backorderable")).toBool(false);
    c.viewCount = readCandidateCount(obj, c.id, QStringLiteral("viewCount"));
    c.purchaseCount = readCandidateCount(obj, c.id, QStringLiteral("purchaseCount"));
    c.returnCount = readCandidateCount(obj, c.id, QStringLiteral("returnCount"));
    c.reviewCount = obj.value(QStringLiteral("reviewCount")).toInt(0);
    c.isTrending = obj.value(QStringLiteral("isTrending")).toBool(false);
    c.hasSpecifications = obj.value(QStringLiteral("hasSpecifications")).toBool(false);
    c.availableRegions = readStringList(obj, QStringLiteral("availableRegions"));
    c.regionalPopularity = readDoubleMap(obj, QStringLiteral("regionalPopularity"));
    return c;
}

UserContext parseUser(const QJsonObject& obj)
{
    UserContext user;
    user.userId = obj.value(QStringLiteral("userId")).toString();
    user.categoryPreferences = readDoubleMap(obj, QStringLiteral("categoryPreferences"));
    user.brandPreferences = readDoubleMap(obj, QStringLiteral("brandPreferences"));
    if (obj.value(QStringLiteral("preferredPriceRange")).isObject()) {
        const QJsonObject range = obj.value(QStringLiteral("preferredPriceRange")).toObject();
        PriceRange band;
        band.min = range.value(QStringLiteral("min")).toDouble(0.0);
        band.max = range.value(QStringLiteral("max")).toDouble(0.0);
        user.preferredPriceRange = band;
    }
    user.categoryFrequency = readIntMap(obj, QStringLiteral("categoryFrequency"));
    user.brandFrequency = readIntMap(obj, QStringLiteral("brandFrequency"));
    user.viewedProductIds = readStringList(obj, QStringLiteral("viewedProductIds"));
    for (const QJsonValue& v : obj.value(QStringLiteral("preferredPurchaseHours")).toArray()) {
        if (v.isDouble()) {
            user.preferredPurchaseHours.push_back(v.toInt());
        }
    }
    user.averagePurchasePrice = obj.value(QStringLiteral("averagePurchasePrice")).toDouble(0.0);
    user.priceSensitivity = obj.value(QStringLiteral("priceSensitivity")).toDouble(0.5);
    user.deviceType = obj.value(QStringLiteral("deviceType")).toString();
    if (obj.value(QStringLiteral("hourOfDay")).isDouble()) {
        user.hourOfDay = obj.value(QStringLiteral("hourOfDay")).toInt();
    }
    return user;
}

QDateTime parseTimestamp(const QJsonValue& value)
{
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(readClampedInt64(value, 0), Qt::UTC);
    }
    if (value.isString()) {
        return QDateTime::fromString(value.toString(), Qt::ISODateWithMs).toUTC();
    }
    return {};
}

QJsonObject subScoreJson(const SubScore& sub)
{
    QJsonObject obj;
    obj[QStringLiteral("value")] = sub.value;
    obj[QStringLiteral("applicable")] = sub.applicable;
    return obj;
}

QString priceBucket(double price)
{
    if (price <= 25.0)  return QStringLiteral("0-25");
    if (price <= 50.0)  return QStringLiteral("25-50");
    if (price <= 100.0) return QStringLiteral("50-100");
    if (price <= 200.0) return QStringLiteral("100-200");
    return QStringLiteral("200+");
}

} // namespace

FacetCounts computeFacets(const std::vector<RankedCandidate>& results)
{
    FacetCounts facets;
    for (const char* bucket : {"0-25", "25-50", "50-100", "100-200", "200+"}) {
        facets.priceRanges.insert(QString::fromLatin1(bucket), 0);
    }
    for (int stars = 1; stars <= 5; ++stars) {
        facets.ratings.insert(QString::number(stars), 0);
    }

    for (const auto& ranked : results) {
        const ProductCandidate& c = ranked.candidate;
        const QString brand = c.brand.isEmpty() ? QStringLiteral("Unknown") : c.brand;
        const QString category = c.category.isEmpty() ? QStringLiteral("Unknown") : c.category;
        facets.brands[brand] += 1;
        facets.categories[category] += 1;
        facets.priceRanges[priceBucket(c.price)] += 1;

        const double rating = std::isfinite(c.rating) ? std::clamp(c.rating, 1.0, 5.0) : 1.0;
        const int stars = static_cast<int>(rating);
        facets.ratings[QString::number(stars)] += 1;
    }
    return facets;
}

QJsonObject facetsToJson(const FacetCounts& facets)
{
    const auto toObject = [](const QMap<QString, int>& counts) {
        QJsonObject obj;
        for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
            obj[it.key()] = it.value();
        }
        return obj;
    };

    QJsonObject out;
    out[QStringLiteral("brands")] = toObject(facets.brands);
    out[QStringLiteral("categories")] = toObject(facets.categories);
    out[QStringLiteral("priceRanges")] = toObject(facets.priceRanges);
    out[QStringLiteral("ratings")] = toObject(facets.ratings);
    return out;
}

std::optional<RankRequest> rankRequestFromJson(const QJsonObject& json, QString* errorOut)
{
    RankRequest request;

    if (json.contains(QStringLiteral("query"))) {
        if (!json.value(QStringLiteral("query")).isObject()) {
            setError(errorOut, QStringLiteral("'query' must be an object"));
            return std::nullopt;
        }
        request.query = parseQuery(json.value(QStringLiteral("query")).toObject(), errorOut);
        if (!request.query) {
            return std::nullopt;
        }
    }

    if (json.contains(QStringLiteral("candidates"))
        && !json.value(QStringLiteral("candidates")).isArray()) {
        setError(errorOut, QStringLiteral("'candidates' must be an array"));
        return std::nullopt;
    }
    const QJsonArray candidates = json.value(QStringLiteral("candidates")).toArray();
    request.candidates.reserve(static_cast<size_t>(candidates.size()));
    for (int i = 0; i < candidates.size(); ++i) {
        const QJsonValue v = candidates.at(i);
        std::optional<ProductCandidate> candidate;
        if (v.isObject()) {
            candidate = parseCandidate(v.toObject());
        }
        if (!candidate) {
            LOG_WARN(srRanking, "Skipping candidate #%d: %s", i,
                     v.isObject() ? "missing 'id'" : "not an object");
            ++request.invalidCount;
            continue;
        }
        request.candidates.push_back(std::move(*candidate));
    }

    if (json.value(QStringLiteral("user")).isObject()) {
        request.user = parseUser(json.value(QStringLiteral("user")).toObject());
    }
    if (json.value(QStringLiteral("geo")).isObject()) {
        const QJsonObject geoObj = json.value(QStringLiteral("geo")).toObject();
        GeoContext geo;
        geo.country = geoObj.value(QStringLiteral("country")).toString();
        geo.region = geoObj.value(QStringLiteral("region")).toString();
        request.geo = geo;
    }

    request.sessionId = json.value(QStringLiteral("sessionId")).toString();
    request.deviceType = json.value(QStringLiteral("deviceType")).toString();
    request.variantName = json.value(QStringLiteral("variant")).toString();
    request.requestTime = parseTimestamp(json.value(QStringLiteral("requestTime")));
    request.deadlineMs = readClampedInt64(json.value(QStringLiteral("deadlineMs")), 0);
    request.limit = std::max(0, json.value(QStringLiteral("limit")).toInt(0));
    return request;
}

QJsonObject categoryWeightsToJson(const CategoryWeights& weights)
{
    QJsonObject obj;
    obj[QStringLiteral("similarity")] = weights.similarity;
    obj[QStringLiteral("business")] = weights.business;
    obj[QStringLiteral("personalization")] = weights.personalization;
    obj[QStringLiteral("geographic")] = weights.geographic;
    return obj;
}

QJsonObject scoreBreakdownToJson(const ScoreBreakdown& breakdown)
{
    QJsonObject similarity;
    similarity[QStringLiteral("visual")] = subScoreJson(breakdown.similarityDetail.visual);
    similarity[QStringLiteral("textual")] = subScoreJson(breakdown.similarityDetail.textual);
    similarity[QStringLiteral("categorical")] = subScoreJson(breakdown.similarityDetail.categorical);
    similarity[QStringLiteral("behavioral")] = subScoreJson(breakdown.similarityDetail.behavioral);

    QJsonObject business;
    business[QStringLiteral("popularity")] = subScoreJson(breakdown.businessDetail.popularity);
    business[QStringLiteral("stock")] = subScoreJson(breakdown.businessDetail.stock);
    business[QStringLiteral("price")] = subScoreJson(breakdown.businessDetail.price);
    business[QStringLiteral("conversion")] = subScoreJson(breakdown.businessDetail.conversion);
    business[QStringLiteral("geographic")] = subScoreJson(breakdown.businessDetail.geographic);

    QJsonObject personalization;
    const PersonalizationScores& p = breakdown.personalizationDetail;
    personalization[QStringLiteral("preference")] = subScoreJson(p.preference);
    personalization[QStringLiteral("behavioral")] = subScoreJson(p.behavioral);
    personalization[QStringLiteral("session")] = subScoreJson(p.session);
    personalization[QStringLiteral("temporal")] = subScoreJson(p.temporal);

    QJsonObject detail;
    detail[QStringLiteral("similarity")] = similarity;
    detail[QStringLiteral("business")] = business;
    detail[QStringLiteral("personalization")] = personalization;

    QJsonObject obj;
    obj[QStringLiteral("similarity")] = breakdown.similarity;
    obj[QStringLiteral("business")] = breakdown.business;
    obj[QStringLiteral("personalization")] = breakdown.personalization;
    obj[QStringLiteral("geographic")] = breakdown.geographic;
    obj[QStringLiteral("finalScore")] = breakdown.finalScore;
    obj[QStringLiteral("weights")] = categoryWeightsToJson(breakdown.effectiveWeights);
    obj[QStringLiteral("detail")] = detail;
    return obj;
}

QJsonObject rankResponseToJson(const RankResponse& response)
{
    QJsonArray results;
    for (const auto& ranked : response.results) {
        const ProductCandidate& c = ranked.candidate;
        QJsonObject obj;
        obj[QStringLiteral("rank")] = ranked.rank;
        obj[QStringLiteral("id")] = c.id;
        obj[QStringLiteral("title")] = c.title;
        obj[QStringLiteral("brand")] = c.brand;
        obj[QStringLiteral("category")] = c.category;
        obj[QStringLiteral("price")] = c.price;
        obj[QStringLiteral("rating")] = c.rating;
        obj[QStringLiteral("finalScore")] = ranked.finalScore;

        QJsonArray reasons;
        for (const QString& reason : ranked.breakdown.reasons) {
            reasons.append(reason);
        }
        obj[QStringLiteral("reasons")] = reasons;
        obj[QStringLiteral("breakdown")] = scoreBreakdownToJson(ranked.breakdown);
        results.append(obj);
    }

    QJsonObject out;
    out[QStringLiteral("variant")] = response.variantName;
    out[QStringLiteral("results")] = results;
    out[QStringLiteral("effectiveWeights")] = categoryWeightsToJson(response.effectiveWeights);
    out[QStringLiteral("personalized")] = response.personalized;
    out[QStringLiteral("geographic")] = response.geographic;
    out[QStringLiteral("timedOut")] = response.timedOut;
    out[QStringLiteral("droppedCount")] = response.droppedCount;
    out[QStringLiteral("filteredCount")] = response.filteredCount;
    out[QStringLiteral("totalCandidates")] = response.totalCandidates;
    out[QStringLiteral("invalidCount")] = response.invalidCount;
    out[QStringLiteral("processingTimeMs")] = static_cast<double>(response.processingTimeMs);
    out[QStringLiteral("facets")] = facetsToJson(computeFacets(response.results));
    return out;
}

std::optional<ExperimentEvent> experimentEventFromJson(const QJsonObject& json, QString* errorOut)
{
    ExperimentEvent event;
    event.sessionId = json.value(QStringLiteral("sessionId")).toString();
    event.variantName = json.value(QStringLiteral("variant")).toString();
    event.candidateId = json.value(QStringLiteral("candidateId")).toString();
    event.position = json.value(QStringLiteral("position")).toInt(0);

    const std::optional<EventKind> kind =
        eventKindFromString(json.value(QStringLiteral("kind")).toString());
    if (!kind) {
        setError(errorOut, QStringLiteral("unknown event kind '%1'")
                               .arg(json.value(QStringLiteral("kind")).toString()));
        return std::nullopt;
    }
    event.kind = *kind;

    if (json.contains(QStringLiteral("timestamp"))) {
        event.timestamp = parseTimestamp(json.value(QStringLiteral("timestamp")));
        if (!event.timestamp.isValid()) {
            setError(errorOut, QStringLiteral("'timestamp' is not a valid time"));
            return std::nullopt;
        }
    }
    return event;
}

QJsonObject experimentEventToJson(const ExperimentEvent& event)
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = event.sessionId;
    obj[QStringLiteral("variant")] = event.variantName;
    obj[QStringLiteral("candidateId")] = event.candidateId;
    obj[QStringLiteral("kind")] = eventKindToString(event.kind);
    obj[QStringLiteral("position")] = event.position;
    if (event.timestamp.isValid()) {
        obj[QStringLiteral("timestamp")] = event.timestamp.toUTC().toString(Qt::ISODateWithMs);
    }
    return obj;
}

} // namespace sr
