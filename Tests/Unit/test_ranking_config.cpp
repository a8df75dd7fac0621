#include <QtTest/QtTest>

#include "core/shared/ranking_config.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

using namespace sr;

namespace {

QJsonObject variantJson(const QString& name, double s, double b, double p, double g = 0.0)
{
    QJsonObject weights;
    weights[QStringLiteral("similarity")] = s;
    weights[QStringLiteral("business")] = b;
    weights[QStringLiteral("personalization")] = p;
    weights[QStringLiteral("geographic")] = g;

    QJsonObject variant;
    variant[QStringLiteral("name")] = name;
    variant[QStringLiteral("weights")] = weights;
    return variant;
}

} // namespace

class TestRankingConfig : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsValidate();
    void testDefaultVariantWeights();
    void testEmptyJsonKeepsDefaults();
    void testOverlayConstants();
    void testVariantsReplaceDefaults();
    void testRejectsWeightsNotSummingToOne();
    void testRejectsNegativeWeight();
    void testRejectsUnknownDefaultVariant();
    void testRejectsDuplicateVariant();
    void testRejectsWrongTypes();
    void testRejectsIntegerOutOfRange_data();
    void testRejectsIntegerOutOfRange();
    void testRejectsNonPositiveCap();
    void testRejectsBadSeasonalMonth();
    void testToJsonRoundTrip();
    void testLoadFromFile();
};

void TestRankingConfig::testDefaultsValidate()
{
    QString error;
    QVERIFY2(RankingConfig::defaults().validate(&error), qPrintable(error));
}

void TestRankingConfig::testDefaultVariantWeights()
{
    const RankingConfig config = RankingConfig::defaults();
    QCOMPARE(static_cast<int>(config.variants.size()), 5);
    QCOMPARE(config.defaultVariant, QStringLiteral("balanced"));

    const VariantConfig* geographic = config.findVariant(QStringLiteral("geographic"));
    QVERIFY(geographic);
    QCOMPARE(geographic->weights.geographic, 0.2);

    const VariantConfig* first = config.findVariant(QStringLiteral("similarity_first"));
    QVERIFY(first);
    QCOMPARE(first->weights.similarity, 0.7);
    QVERIFY(!config.findVariant(QStringLiteral("nope")));
}

void TestRankingConfig::testEmptyJsonKeepsDefaults()
{
    QString error;
    const auto config = RankingConfig::fromJson(QJsonObject{}, &error);
    QVERIFY2(config.has_value(), qPrintable(error));
    QCOMPARE(static_cast<int>(config->variants.size()), 5);
    QCOMPARE(config->constants.logisticSteepness, 10.0);
    QCOMPARE(config->experiment.minImpressionSample, 100);
}

void TestRankingConfig::testOverlayConstants()
{
    QJsonObject constants;
    constants[QStringLiteral("logisticSteepness")] = 8.0;
    constants[QStringLiteral("maxReasons")] = 2;
    QJsonObject experiment;
    experiment[QStringLiteral("retentionDays")] = 7;

    QJsonObject json;
    json[QStringLiteral("constants")] = constants;
    json[QStringLiteral("experiment")] = experiment;
    json[QStringLiteral("workerThreads")] = 3;

    QString error;
    const auto config = RankingConfig::fromJson(json, &error);
    QVERIFY2(config.has_value(), qPrintable(error));
    QCOMPARE(config->constants.logisticSteepness, 8.0);
    QCOMPARE(config->constants.maxReasons, 2);
    QCOMPARE(config->constants.viewsCap, 10000.0);
    QCOMPARE(config->experiment.retentionDays, 7);
    QCOMPARE(config->workerThreads, 3);
}

void TestRankingConfig::testVariantsReplaceDefaults()
{
    QJsonArray variants;
    variants.append(variantJson(QStringLiteral("control"), 0.5, 0.5, 0.0));
    variants.append(variantJson(QStringLiteral("treatment"), 0.4, 0.4, 0.2));

    QJsonObject json;
    json[QStringLiteral("variants")] = variants;
    json[QStringLiteral("defaultVariant")] = QStringLiteral("control");

    QString error;
    const auto config = RankingConfig::fromJson(json, &error);
    QVERIFY2(config.has_value(), qPrintable(error));
    QCOMPARE(static_cast<int>(config->variants.size()), 2);
    QVERIFY(config->findVariant(QStringLiteral("treatment")));
    QVERIFY(!config->findVariant(QStringLiteral("balanced")));
}

void TestRankingConfig::testRejectsWeightsNotSummingToOne()
{
    QJsonArray variants;
    variants.append(variantJson(QStringLiteral("bad"), 0.5, 0.3, 0.3));
    QJsonObject json;
    json[QStringLiteral("variants")] = variants;
    json[QStringLiteral("defaultVariant")] = QStringLiteral("bad");

    QString error;
    QVERIFY(!RankingConfig::fromJson(json, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("bad")));
    QVERIFY(error.contains(QStringLiteral("sum")));

    RankingConfig config = RankingConfig::defaults();
    config.businessWeights.stock = 0.5;
    QVERIFY(!config.validate(&error));
    QVERIFY(error.contains(QStringLiteral("businessWeights")));
}

void TestRankingConfig::testRejectsNegativeWeight()
{
    RankingConfig config = RankingConfig::defaults();
    config.variants[0].weights = CategoryWeights{1.2, -0.2, 0.0, 0.0};
    QString error;
    QVERIFY(!config.validate(&error));
    QVERIFY(!error.isEmpty());
}

void TestRankingConfig::testRejectsUnknownDefaultVariant()
{
    QJsonObject json;
    json[QStringLiteral("defaultVariant")] = QStringLiteral("missing");
    QString error;
    QVERIFY(!RankingConfig::fromJson(json, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("missing")));
}

void TestRankingConfig::testRejectsDuplicateVariant()
{
    QJsonArray variants;
    variants.append(variantJson(QStringLiteral("twin"), 0.5, 0.5, 0.0));
    variants.append(variantJson(QStringLiteral("twin"), 0.4, 0.4, 0.2));
    QJsonObject json;
    json[QStringLiteral("variants")] = variants;
    json[QStringLiteral("defaultVariant")] = QStringLiteral("twin");

    QString error;
    QVERIFY(!RankingConfig::fromJson(json, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("duplicate")));
}

void TestRankingConfig::testRejectsWrongTypes()
{
    QString error;

    QJsonObject notArray;
    notArray[QStringLiteral("variants")] = QStringLiteral("balanced");
    QVERIFY(!RankingConfig::fromJson(notArray, &error).has_value());

    QJsonObject constants;
    constants[QStringLiteral("viewsCap")] = QStringLiteral("ten thousand");
    QJsonObject badNumber;
    badNumber[QStringLiteral("constants")] = constants;
    QVERIFY(!RankingConfig::fromJson(badNumber, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("viewsCap")));

    QJsonObject notObject;
    notObject[QStringLiteral("businessWeights")] = 0.5;
    QVERIFY(!RankingConfig::fromJson(notObject, &error).has_value());
}

void TestRankingConfig::testRejectsIntegerOutOfRange_data()
{
    QTest::addColumn<QString>("json");
    QTest::addColumn<QString>("key");

    QTest::newRow("timeout too large")
        << QStringLiteral(R"({"defaultTimeoutMs": 1e12})") << QStringLiteral("defaultTimeoutMs");
    QTest::newRow("threads too small")
        << QStringLiteral(R"({"workerThreads": -1e15})") << QStringLiteral("workerThreads");
    QTest::newRow("retention too large")
        << QStringLiteral(R"({"experiment": {"retentionDays": 1e10}})")
        << QStringLiteral("retentionDays");
    QTest::newRow("reasons too large")
        << QStringLiteral(R"({"constants": {"maxReasons": 3e9}})") << QStringLiteral("maxReasons");
}

void TestRankingConfig::testRejectsIntegerOutOfRange()
{
    QFETCH(QString, json);
    QFETCH(QString, key);

    QString error;
    const QJsonObject obj = QJsonDocument::fromJson(json.toUtf8()).object();
    QVERIFY(!RankingConfig::fromJson(obj, &error).has_value());
    QVERIFY2(error.contains(key), qPrintable(error));
    QVERIFY2(error.contains(QStringLiteral("out of range")), qPrintable(error));
}

void TestRankingConfig::testRejectsNonPositiveCap()
{
    RankingConfig config = RankingConfig::defaults();
    config.constants.shippingCostCap = 0.0;
    QString error;
    QVERIFY(!config.validate(&error));
    QVERIFY(error.contains(QStringLiteral("shippingCostCap")));
}

void TestRankingConfig::testRejectsBadSeasonalMonth()
{
    QJsonObject seasons;
    seasons[QStringLiteral("swimwear")] = QJsonArray{6, 13};
    QJsonObject json;
    json[QStringLiteral("seasonalCategories")] = seasons;

    QString error;
    QVERIFY(!RankingConfig::fromJson(json, &error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestRankingConfig::testToJsonRoundTrip()
{
    RankingConfig original = RankingConfig::defaults();
    original.defaultVariant = QStringLiteral("personalized");
    original.constants.reasonThreshold = 0.6;
    original.defaultTimeoutMs = 250;

    QString error;
    const auto parsed = RankingConfig::fromJson(original.toJson(), &error);
    QVERIFY2(parsed.has_value(), qPrintable(error));
    QCOMPARE(parsed->defaultVariant, QStringLiteral("personalized"));
    QCOMPARE(parsed->constants.reasonThreshold, 0.6);
    QCOMPARE(parsed->defaultTimeoutMs, 250);
    QCOMPARE(parsed->variants.size(), original.variants.size());
    QCOMPARE(parsed->seasonalCategories.size(), original.seasonalCategories.size());
}

void TestRankingConfig::testLoadFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString goodPath = dir.filePath(QStringLiteral("ranking.json"));
    {
        QFile file(goodPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QJsonObject json;
        json[QStringLiteral("defaultVariant")] = QStringLiteral("business_first");
        file.write(QJsonDocument(json).toJson());
    }
    QString error;
    const auto config = RankingConfig::loadFromFile(goodPath, &error);
    QVERIFY2(config.has_value(), qPrintable(error));
    QCOMPARE(config->defaultVariant, QStringLiteral("business_first"));

    const QString brokenPath = dir.filePath(QStringLiteral("broken.json"));
    {
        QFile file(brokenPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ \"variants\": [");
    }
    QVERIFY(!RankingConfig::loadFromFile(brokenPath, &error).has_value());
    QVERIFY(!RankingConfig::loadFromFile(dir.filePath(QStringLiteral("absent.json")), &error)
                 .has_value());
}

QTEST_MAIN(TestRankingConfig)
#include "test_ranking_config.moc"
