#include <QtTest/QtTest>

#include "catalog_fixtures.h"
#include "core/experiment/variant_selector.h"
#include "core/ranking/ranking_json.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <limits>

using namespace sr;
using namespace sr::test;

namespace {

QJsonObject parse(const char* text)
{
    return QJsonDocument::fromJson(QByteArray(text)).object();
}

RankedCandidate ranked(const QString& id, const QString& brand, const QString& category,
                       double price, double rating)
{
    RankedCandidate r;
    r.candidate = makeCandidate(id, category, price);
    r.candidate.brand = brand;
    r.candidate.rating = rating;
    return r;
}

} // namespace

class TestRankingJson : public QObject {
    Q_OBJECT

private slots:
    void testParseFullRequest();
    void testParseWithoutQuery();
    void testParseRejectsMalformed_data();
    void testParseRejectsMalformed();
    void testBadCandidatesDoNotFailRequest();
    void testOversizedIntegersSaturate();
    void testRequestTimeFormats();
    void testFacetBuckets();
    void testResponseJsonShape();
    void testEventFromJson();
    void testEventRejectsUnknownKind();
    void testEventToJson();
};

void TestRankingJson::testParseFullRequest()
{
    const QJsonObject json = parse(R"({
        "query": {"text": "trail shoes", "vector": [1, 0, 0, 0],
                  "targetCategory": "footwear", "minPrice": 20, "maxPrice": 150,
                  "intent": "purchase"},
        "candidates": [
            {"id": "sku-1", "title": "Trail Runner", "brand": "Acme", "category": "footwear",
             "price": 89.5, "stockQuantity": 12, "rating": 4.5, "reviewCount": 80,
             "vector": [0.9, 0.1, 0, 0], "tags": ["trail", "running"],
             "conversionRate": 0.04, "availableRegions": ["US"],
             "regionalPopularity": {"US": 0.7}},
            {"id": "sku-2", "price": 40, "inStock": false}
        ],
        "user": {"userId": "u-1", "brandPreferences": {"Acme": 0.9},
                 "categoryFrequency": {"footwear": 4},
                 "preferredPriceRange": {"min": 50, "max": 120},
                 "viewedProductIds": ["sku-9"], "deviceType": "mobile", "hourOfDay": 21},
        "geo": {"country": "US", "region": "west", "shippingZone": "domestic"},
        "sessionId": "s-1",
        "deviceType": "tablet",
        "variant": "balanced",
        "requestTime": "2026-12-14T10:00:00Z",
        "deadlineMs": 1797242400000,
        "limit": 10
    })");

    QString error;
    const std::optional<RankRequest> request = rankRequestFromJson(json, &error);
    QVERIFY2(request, qPrintable(error));

    QVERIFY(request->query.has_value());
    const QueryContext& query = *request->query;
    QCOMPARE(*query.text, QStringLiteral("trail shoes"));
    QCOMPARE(static_cast<int>(query.vector->size()), 4);
    QCOMPARE(*query.targetCategory, QStringLiteral("footwear"));
    QCOMPARE(*query.minPrice, 20.0);
    QCOMPARE(*query.maxPrice, 150.0);
    QVERIFY(*query.intent == SearchIntent::Purchase);

    QCOMPARE(static_cast<int>(request->candidates.size()), 2);
    const ProductCandidate& first = request->candidates[0];
    QCOMPARE(first.id, QStringLiteral("sku-1"));
    QCOMPARE(first.price, 89.5);
    QCOMPARE(first.stockQuantity, 12);
    QCOMPARE(first.reviewCount, 80);
    QCOMPARE(first.tags, QStringList({QStringLiteral("trail"), QStringLiteral("running")}));
    QCOMPARE(*first.conversionRate, 0.04);
    QCOMPARE(first.regionalPopularity.value(QStringLiteral("US")), 0.7);
    QVERIFY(first.inStock);
    QVERIFY(!request->candidates[1].inStock);
    QVERIFY(!request->candidates[1].conversionRate.has_value());

    QVERIFY(request->user.has_value());
    QCOMPARE(request->user->userId, QStringLiteral("u-1"));
    QCOMPARE(request->user->preferredPriceRange->max, 120.0);
    QCOMPARE(*request->user->hourOfDay, 21);
    QCOMPARE(request->geo->region, QStringLiteral("west"));

    QCOMPARE(request->sessionId, QStringLiteral("s-1"));
    QCOMPARE(request->deviceType, QStringLiteral("tablet"));
    QCOMPARE(request->variantName, QStringLiteral("balanced"));
    QCOMPARE(request->requestTime, fixedRequestTime());
    QCOMPARE(request->deadlineMs, qint64(1797242400000LL));
    QCOMPARE(request->limit, 10);
}

void TestRankingJson::testParseWithoutQuery()
{
    QString error;
    const auto request = rankRequestFromJson(parse(R"({"candidates": [{"id": "a"}]})"), &error);
    QVERIFY2(request, qPrintable(error));
    QVERIFY(!request->query.has_value());
    QVERIFY(!request->user.has_value());
    QVERIFY(!request->geo.has_value());
    QCOMPARE(request->limit, 0);
}

void TestRankingJson::testParseRejectsMalformed_data()
{
    QTest::addColumn<QString>("json");

    QTest::newRow("query not object") << QStringLiteral(R"({"query": "shoes"})");
    QTest::newRow("candidates not array") << QStringLiteral(R"({"query": {}, "candidates": {}})");
    QTest::newRow("vector with text")
        << QStringLiteral(R"({"query": {"vector": [1, "x"]}, "candidates": []})");
    QTest::newRow("minPrice not number")
        << QStringLiteral(R"({"query": {"minPrice": "10"}, "candidates": []})");
}

void TestRankingJson::testParseRejectsMalformed()
{
    QFETCH(QString, json);
    QString error;
    QVERIFY(!rankRequestFromJson(QJsonDocument::fromJson(json.toUtf8()).object(), &error));
    QVERIFY(!error.isEmpty());
}

void TestRankingJson::testBadCandidatesDoNotFailRequest()
{
    const QJsonObject json = parse(R"({
        "query": {"vector": [1, 0, 0, 0]},
        "candidates": [
            {"price": 5},
            1,
            {"id": "a", "price": "cheap", "vector": [1, "x"], "rating": 4.5,
             "conversionRate": "high", "viewCount": "many"},
            {"id": "b", "price": 5, "vector": [1, 0, 0, 0]}
        ],
        "sessionId": "s-1",
        "requestTime": "2026-12-14T10:00:00Z"
    })");

    QString error;
    const std::optional<RankRequest> request = rankRequestFromJson(json, &error);
    QVERIFY2(request, qPrintable(error));
    QCOMPARE(request->invalidCount, 2);
    QCOMPARE(static_cast<int>(request->candidates.size()), 2);

    // Wrong-typed fields fall back to their defaults; the rest is kept.
    const ProductCandidate& a = request->candidates[0];
    QCOMPARE(a.id, QStringLiteral("a"));
    QCOMPARE(a.price, 0.0);
    QVERIFY(a.vector.empty());
    QVERIFY(!a.conversionRate.has_value());
    QCOMPARE(a.viewCount, int64_t(0));
    QCOMPARE(a.rating, 4.5);

    const RankingConfig config = RankingConfig::defaults();
    VariantSelector selector(config);
    RankingEngine engine(config, selector);
    const std::optional<RankResponse> response = engine.rank(*request);
    QVERIFY(response);
    QCOMPARE(static_cast<int>(response->results.size()), 2);
    QCOMPARE(response->totalCandidates, 2);
    QCOMPARE(response->invalidCount, 2);

    // "a" lost its vector, so only "b" has a visual score.
    const auto findResult = [&response](const QString& id) -> const RankedCandidate* {
        for (const RankedCandidate& r : response->results) {
            if (r.candidate.id == id) {
                return &r;
            }
        }
        return nullptr;
    };
    const RankedCandidate* rankedA = findResult(QStringLiteral("a"));
    const RankedCandidate* rankedB = findResult(QStringLiteral("b"));
    QVERIFY(rankedA && rankedB);
    QVERIFY(!rankedA->breakdown.similarityDetail.visual.applicable);
    QVERIFY(rankedB->breakdown.similarityDetail.visual.applicable);

    const QJsonObject out = rankResponseToJson(*response);
    QCOMPARE(out.value(QStringLiteral("invalidCount")).toInt(), 2);
    QCOMPARE(out.value(QStringLiteral("results")).toArray().size(), 2);
}

void TestRankingJson::testOversizedIntegersSaturate()
{
    const QJsonObject json = parse(R"({
        "query": {},
        "candidates": [{"id": "a", "viewCount": 1e300, "purchaseCount": -5}],
        "deadlineMs": 1e30
    })");

    const std::optional<RankRequest> request = rankRequestFromJson(json);
    QVERIFY(request);
    QCOMPARE(request->deadlineMs, std::numeric_limits<qint64>::max());
    QCOMPARE(static_cast<int>(request->candidates.size()), 1);
    QCOMPARE(request->candidates[0].viewCount,
             static_cast<int64_t>(std::numeric_limits<qint64>::max()));
    QCOMPARE(request->candidates[0].purchaseCount, int64_t(0));
}

void TestRankingJson::testRequestTimeFormats()
{
    QJsonObject json;
    json[QStringLiteral("query")] = QJsonObject();
    json[QStringLiteral("requestTime")] =
        static_cast<double>(fixedRequestTime().toMSecsSinceEpoch());
    const auto fromEpoch = rankRequestFromJson(json);
    QVERIFY(fromEpoch);
    QCOMPARE(fromEpoch->requestTime, fixedRequestTime());

    json.remove(QStringLiteral("requestTime"));
    const auto unset = rankRequestFromJson(json);
    QVERIFY(unset);
    QVERIFY(!unset->requestTime.isValid());
}

void TestRankingJson::testFacetBuckets()
{
    const std::vector<RankedCandidate> results = {
        ranked(QStringLiteral("a"), QStringLiteral("Acme"), QStringLiteral("footwear"), 25.0, 4.9),
        ranked(QStringLiteral("b"), QStringLiteral("Acme"), QStringLiteral("footwear"), 25.01, 3.2),
        ranked(QStringLiteral("c"), QString(), QStringLiteral("books"), 100.0, 0.0),
        ranked(QStringLiteral("d"), QStringLiteral("Zed"), QString(), 250.0, 5.0),
    };

    const FacetCounts facets = computeFacets(results);
    QCOMPARE(facets.brands.value(QStringLiteral("Acme")), 2);
    QCOMPARE(facets.brands.value(QStringLiteral("Unknown")), 1);
    QCOMPARE(facets.categories.value(QStringLiteral("Unknown")), 1);
    QCOMPARE(facets.categories.value(QStringLiteral("footwear")), 2);

    QCOMPARE(facets.priceRanges.size(), 5);
    QCOMPARE(facets.priceRanges.value(QStringLiteral("0-25")), 1);
    QCOMPARE(facets.priceRanges.value(QStringLiteral("25-50")), 1);
    QCOMPARE(facets.priceRanges.value(QStringLiteral("50-100")), 1);
    QCOMPARE(facets.priceRanges.value(QStringLiteral("100-200")), 0);
    QCOMPARE(facets.priceRanges.value(QStringLiteral("200+")), 1);

    QCOMPARE(facets.ratings.size(), 5);
    QCOMPARE(facets.ratings.value(QStringLiteral("4")), 1);
    QCOMPARE(facets.ratings.value(QStringLiteral("3")), 1);
    QCOMPARE(facets.ratings.value(QStringLiteral("1")), 1);
    QCOMPARE(facets.ratings.value(QStringLiteral("5")), 1);
    QCOMPARE(facets.ratings.value(QStringLiteral("2")), 0);

    const QJsonObject json = facetsToJson(facets);
    QCOMPARE(json.value(QStringLiteral("priceRanges")).toObject()
                 .value(QStringLiteral("200+")).toInt(),
             1);
}

void TestRankingJson::testResponseJsonShape()
{
    RankResponse response;
    response.variantName = QStringLiteral("balanced");
    response.effectiveWeights = {0.4, 0.3, 0.3, 0.0};
    response.personalized = true;
    response.totalCandidates = 3;
    response.filteredCount = 1;
    response.droppedCount = 1;
    response.timedOut = true;

    RankedCandidate first = ranked(QStringLiteral("sku-1"), QStringLiteral("Acme"),
                                   QStringLiteral("footwear"), 80.0, 4.0);
    first.rank = 1;
    first.finalScore = 0.75;
    first.breakdown.finalScore = 0.75;
    first.breakdown.reasons = {QStringLiteral("in stock")};
    first.breakdown.businessDetail.stock = {0.8, true};
    first.candidate.vector = {1.0f, 0.0f};
    response.results.push_back(first);

    const QJsonObject json = rankResponseToJson(response);
    QCOMPARE(json.value(QStringLiteral("variant")).toString(), QStringLiteral("balanced"));
    QCOMPARE(json.value(QStringLiteral("totalCandidates")).toInt(), 3);
    QCOMPARE(json.value(QStringLiteral("filteredCount")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("droppedCount")).toInt(), 1);
    QVERIFY(json.value(QStringLiteral("timedOut")).toBool());
    QVERIFY(json.value(QStringLiteral("personalized")).toBool());
    QVERIFY(!json.value(QStringLiteral("geographic")).toBool());
    QCOMPARE(json.value(QStringLiteral("effectiveWeights")).toObject()
                 .value(QStringLiteral("similarity")).toDouble(),
             0.4);

    const QJsonArray results = json.value(QStringLiteral("results")).toArray();
    QCOMPARE(results.size(), 1);
    const QJsonObject result = results.at(0).toObject();
    QCOMPARE(result.value(QStringLiteral("rank")).toInt(), 1);
    QCOMPARE(result.value(QStringLiteral("id")).toString(), QStringLiteral("sku-1"));
    QCOMPARE(result.value(QStringLiteral("finalScore")).toDouble(), 0.75);
    QVERIFY(!result.contains(QStringLiteral("vector")));
    QCOMPARE(result.value(QStringLiteral("reasons")).toArray().at(0).toString(),
             QStringLiteral("in stock"));

    const QJsonObject stock = result.value(QStringLiteral("breakdown")).toObject()
                                  .value(QStringLiteral("detail")).toObject()
                                  .value(QStringLiteral("business")).toObject()
                                  .value(QStringLiteral("stock")).toObject();
    QCOMPARE(stock.value(QStringLiteral("value")).toDouble(), 0.8);
    QVERIFY(stock.value(QStringLiteral("applicable")).toBool());

    QVERIFY(json.value(QStringLiteral("facets")).toObject().contains(QStringLiteral("brands")));
}

void TestRankingJson::testEventFromJson()
{
    QString error;
    const auto event = experimentEventFromJson(parse(R"({
        "sessionId": "s-1", "variant": "balanced", "candidateId": "sku-1",
        "kind": "view", "position": 3, "timestamp": "2026-12-14T10:00:00.000Z"
    })"), &error);
    QVERIFY2(event, qPrintable(error));
    QCOMPARE(event->sessionId, QStringLiteral("s-1"));
    QCOMPARE(event->variantName, QStringLiteral("balanced"));
    QCOMPARE(event->candidateId, QStringLiteral("sku-1"));
    QVERIFY(event->kind == EventKind::Impression);
    QCOMPARE(event->position, 3);
    QCOMPARE(event->timestamp, fixedRequestTime());

    const auto untimed = experimentEventFromJson(parse(R"({
        "sessionId": "s-1", "candidateId": "sku-1", "kind": "purchase"
    })"));
    QVERIFY(untimed);
    QVERIFY(!untimed->timestamp.isValid());
    QVERIFY(untimed->variantName.isEmpty());
}

void TestRankingJson::testEventRejectsUnknownKind()
{
    QString error;
    QVERIFY(!experimentEventFromJson(parse(R"({"sessionId": "s", "candidateId": "c",
                                               "kind": "wishlist"})"),
                                     &error));
    QVERIFY(error.contains(QStringLiteral("wishlist")));

    QVERIFY(!experimentEventFromJson(parse(R"({"sessionId": "s", "candidateId": "c",
                                               "kind": "click", "timestamp": "yesterday"})"),
                                     &error));
}

void TestRankingJson::testEventToJson()
{
    const ExperimentEvent event = makeEvent(QStringLiteral("s-2"), QStringLiteral("personalized"),
                                            QStringLiteral("sku-4"), EventKind::Click,
                                            fixedRequestTime(), 2);
    const QJsonObject json = experimentEventToJson(event);
    QCOMPARE(json.value(QStringLiteral("kind")).toString(), QStringLiteral("click"));
    QCOMPARE(json.value(QStringLiteral("position")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("timestamp")).toString(),
             QStringLiteral("2026-12-14T10:00:00.000Z"));
}

QTEST_MAIN(TestRankingJson)
#include "test_ranking_json.moc"
