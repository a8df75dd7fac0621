#include <QtTest/QtTest>

#include "core/ranking/business_scorer.h"
#include "core/ranking/ranking_engine.h"
#include "catalog_fixtures.h"

using namespace sr;

class TestBusinessScorer : public QObject {
    Q_OBJECT

private slots:
    void testStockSteps_data();
    void testStockSteps();
    void testStockMonotonicity();
    void testPopularityCaps();
    void testPriceCompetitiveness();
    void testConversionExplicitRates();
    void testConversionDerivedFromCounts();
    void testGeographicNeedsGeo();
    void testGeographicFullMarks();
    void testConfigurableCaps();
};

void TestBusinessScorer::testStockSteps_data()
{
    QTest::addColumn<int>("quantity");
    QTest::addColumn<bool>("inStock");
    QTest::addColumn<bool>("backorderable");
    QTest::addColumn<double>("expected");

    QTest::newRow("backorder") << 0 << false << true << 0.2;
    QTest::newRow("flagged-out") << 20 << false << false << 0.1;
    QTest::newRow("empty") << 0 << true << false << 0.1;
    QTest::newRow("plenty") << 51 << true << false << 1.0;
    QTest::newRow("upper-mid") << 50 << true << false << 0.8;
    QTest::newRow("lower-mid") << 10 << true << false << 0.8;
    QTest::newRow("low") << 9 << true << false << 0.6;
    QTest::newRow("last-one") << 1 << true << false << 0.6;
}

void TestBusinessScorer::testStockSteps()
{
    QFETCH(int, quantity);
    QFETCH(bool, inStock);
    QFETCH(bool, backorderable);
    QFETCH(double, expected);

    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.stockQuantity = quantity;
    c.inStock = inStock;
    c.backorderable = backorderable;
    QCOMPARE(BusinessScorer::stockScore(c), expected);
}

void TestBusinessScorer::testStockMonotonicity()
{
    BusinessScorer scorer;
    const BusinessWeights weights;
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));

    double previous = -1.0;
    for (int quantity : {0, 1, 9, 10, 50, 51, 100, 1000}) {
        c.stockQuantity = quantity;
        c.inStock = quantity > 0;
        const double category =
            RankingEngine::businessCategoryScore(scorer.score(c, nullptr), weights);
        QVERIFY2(category >= previous, qPrintable(QStringLiteral("quantity %1").arg(quantity)));
        previous = category;
    }
}

void TestBusinessScorer::testPopularityCaps()
{
    BusinessScorer scorer;
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.popularityScore = 1.0;
    c.viewCount = 20000;
    c.purchaseCount = 2000;
    c.rating = 5.0;
    c.reviewCount = 1000;
    QVERIFY(qAbs(scorer.popularityScore(c) - 1.0) < 1e-9);

    c.popularityScore = 0.0;
    c.viewCount = 0;
    c.purchaseCount = 0;
    c.rating = 0.0;
    c.reviewCount = 0;
    QCOMPARE(scorer.popularityScore(c), 0.0);

    // Half of every term
    c.popularityScore = 0.5;
    c.viewCount = 5000;
    c.purchaseCount = 500;
    c.rating = 2.5;
    c.reviewCount = 250;
    QVERIFY(qAbs(scorer.popularityScore(c) - 0.5) < 1e-9);
}

void TestBusinessScorer::testPriceCompetitiveness()
{
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.categoryAvgPrice = 0.0;
    c.originalPrice = 0.0;
    QVERIFY(qAbs(BusinessScorer::priceScore(c) - 0.5) < 1e-9);

    c.price = 50.0;
    c.categoryAvgPrice = 100.0;
    QVERIFY(qAbs(BusinessScorer::priceScore(c) - 0.85) < 1e-9);

    c.originalPrice = 100.0;
    QVERIFY(qAbs(BusinessScorer::priceScore(c) - 1.0) < 1e-9);

    c.originalPrice = 0.0;
    c.price = 300.0;
    QVERIFY(qAbs(BusinessScorer::priceScore(c) - 0.1) < 1e-9);

    c.price = 1000.0;
    QCOMPARE(BusinessScorer::priceScore(c), 0.0);
}

void TestBusinessScorer::testConversionExplicitRates()
{
    BusinessScorer scorer;
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.conversionRate = 0.25;
    c.addToCartRate = 0.30;
    c.returnRate = 0.0;
    QVERIFY(qAbs(scorer.conversionScore(c) - 1.0) < 1e-9);

    c.conversionRate = 0.0;
    c.addToCartRate = 0.0;
    c.returnRate = 0.5;
    QCOMPARE(scorer.conversionScore(c), 0.0);
}

void TestBusinessScorer::testConversionDerivedFromCounts()
{
    BusinessScorer scorer;
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.viewCount = 1000;
    c.purchaseCount = 100;
    c.returnCount = 0;

    // 0.1 / 0.2 * 0.5 + 0 + 1.0 * 0.2
    QVERIFY(qAbs(scorer.conversionScore(c) - 0.45) < 1e-9);

    // 5 returns of 100 purchases halves the return term
    c.returnCount = 5;
    QVERIFY(qAbs(scorer.conversionScore(c) - 0.35) < 1e-9);
}

void TestBusinessScorer::testGeographicNeedsGeo()
{
    BusinessScorer scorer;
    const BusinessScores scores = scorer.score(test::makeCandidate(QStringLiteral("p1")), nullptr);
    QVERIFY(!scores.geographic.applicable);
    QCOMPARE(scores.geographic.value, 0.0);
    QVERIFY(scores.popularity.applicable);
    QVERIFY(scores.stock.applicable);
}

void TestBusinessScorer::testGeographicFullMarks()
{
    BusinessScorer scorer;
    const GeoContext geo = test::makeGeo(QStringLiteral("US"));
    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.availableRegions = {QStringLiteral("us"), QStringLiteral("CA")};
    c.shippingCost = 0.0;
    c.shippingDays = 0.0;
    c.regionalPopularity.insert(QStringLiteral("US"), 1.0);

    const SubScore full = scorer.geographicScore(c, &geo);
    QVERIFY(full.applicable);
    QVERIFY(qAbs(full.value - 0.6) < 1e-9);

    c.availableRegions = {QStringLiteral("DE")};
    c.shippingCost = 100.0;
    c.shippingDays = 30.0;
    c.regionalPopularity.clear();
    const SubScore none = scorer.geographicScore(c, &geo);
    QVERIFY(none.applicable);
    QCOMPARE(none.value, 0.0);
}

void TestBusinessScorer::testConfigurableCaps()
{
    ScoringConstants constants;
    constants.viewsCap = 100.0;
    BusinessScorer tight(constants);
    BusinessScorer loose;

    ProductCandidate c = test::makeCandidate(QStringLiteral("p1"));
    c.viewCount = 100;
    QVERIFY(tight.popularityScore(c) > loose.popularityScore(c));
}

QTEST_MAIN(TestBusinessScorer)
#include "test_business_scorer.moc"
