#include "core/shared/ranking_config.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>

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

// Overlay helpers: an absent key keeps the current value, a present key of
// the wrong type is an error.
bool readDouble(const QJsonObject& obj, const QString& key, double* target,
                QString* errorOut)
{
    if (!obj.contains(key)) {
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

bool readInt(const QJsonObject& obj, const QString& key, int* target, QString* errorOut)
{
    if (!obj.contains(key)) {
        return true;
    }
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        setError(errorOut, QStringLiteral("'%1' must be an integer").arg(key));
        return false;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw) || std::floor(raw) != raw) {
        setError(errorOut, QStringLiteral("'%1' must be an integer").arg(key));
        return false;
    }
    if (raw < static_cast<double>(std::numeric_limits<int>::min())
        || raw > static_cast<double>(std::numeric_limits<int>::max())) {
        setError(errorOut, QStringLiteral("'%1' is out of range").arg(key));
        return false;
    }
    *target = static_cast<int>(raw);
    return true;
}

bool readObject(const QJsonObject& obj, const QString& key, QJsonObject* target,
                QString* errorOut)
{
    const QJsonValue value = obj.value(key);
    if (!value.isObject()) {
        setError(errorOut, QStringLiteral("'%1' must be an object").arg(key));
        return false;
    }
    *target = value.toObject();
    return true;
}

bool parseCategoryWeights(const QJsonObject& obj, CategoryWeights* weights, QString* errorOut)
{
    return readDouble(obj, QStringLiteral("similarity"), &weights->similarity, errorOut)
        && readDouble(obj, QStringLiteral("business"), &weights->business, errorOut)
        && readDouble(obj, QStringLiteral("personalization"), &weights->personalization, errorOut)
        && readDouble(obj, QStringLiteral("geographic"), &weights->geographic, errorOut);
}

QJsonObject categoryWeightsToJson(const CategoryWeights& weights)
{
    QJsonObject json;
    json.insert(QStringLiteral("similarity"), weights.similarity);
    json.insert(QStringLiteral("business"), weights.business);
    json.insert(QStringLiteral("personalization"), weights.personalization);
    json.insert(QStringLiteral("geographic"), weights.geographic);
    return json;
}

bool checkWeightGroup(const QString& group, const std::vector<double>& values,
                      QString* errorOut)
{
    double sum = 0.0;
    for (double v : values) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            setError(errorOut, QStringLiteral("%1: weights must lie in [0,1]").arg(group));
            return false;
        }
        sum += v;
    }
    if (std::abs(sum - 1.0) > kWeightEpsilon) {
        setError(errorOut, QStringLiteral("%1: weights sum to %2, expected 1.0")
                               .arg(group)
                               .arg(sum, 0, 'f', 6));
        return false;
    }
    return true;
}

bool checkPositive(const QString& name, double value, QString* errorOut)
{
    if (!std::isfinite(value) || value <= 0.0) {
        setError(errorOut, QStringLiteral("constants.%1 must be > 0").arg(name));
        return false;
    }
    return true;
}

VariantConfig makeVariant(const char* name, double similarity, double business,
                          double personalization, double geographic = 0.0)
{
    VariantConfig variant;
    variant.name = QString::fromLatin1(name);
    variant.weights.similarity = similarity;
    variant.weights.business = business;
    variant.weights.personalization = personalization;
    variant.weights.geographic = geographic;
    return variant;
}

} // namespace

RankingConfig RankingConfig::defaults()
{
    RankingConfig config;
    config.variants = {
        makeVariant("similarity_first", 0.7, 0.2, 0.1),
        makeVariant("business_first", 0.3, 0.5, 0.2),
        makeVariant("balanced", 0.4, 0.3, 0.3),
        makeVariant("personalized", 0.2, 0.3, 0.5),
        makeVariant("geographic", 0.4, 0.2, 0.2, 0.2),
    };
    config.defaultVariant = QStringLiteral("balanced");
    config.seasonalCategories = {
        {QStringLiteral("winter_clothing"), {11, 12, 1, 2}},
        {QStringLiteral("summer_clothing"), {5, 6, 7, 8}},
        {QStringLiteral("electronics"), {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}},
        {QStringLiteral("gifts"), {11, 12, 2, 5}},
    };
    return config;
}

const VariantConfig* RankingConfig::findVariant(const QString& name) const
{
    for (const VariantConfig& variant : variants) {
        if (variant.name == name) {
            return &variant;
        }
    }
    return nullptr;
}

std::optional<RankingConfig> RankingConfig::fromJson(const QJsonObject& json, QString* errorOut)
{
    RankingConfig config = defaults();

    if (json.contains(QStringLiteral("variants"))) {
        const QJsonValue variantsValue = json.value(QStringLiteral("variants"));
        if (!variantsValue.isArray()) {
            setError(errorOut, QStringLiteral("'variants' must be an array"));
            return std::nullopt;
        }
        config.variants.clear();
        for (const QJsonValue& entry : variantsValue.toArray()) {
            if (!entry.isObject()) {
                setError(errorOut, QStringLiteral("variant entries must be objects"));
                return std::nullopt;
            }
            const QJsonObject obj = entry.toObject();
            VariantConfig variant;
            variant.name = obj.value(QStringLiteral("name")).toString();
            QJsonObject weightsObj;
            if (!readObject(obj, QStringLiteral("weights"), &weightsObj, errorOut)
                || !parseCategoryWeights(weightsObj, &variant.weights, errorOut)
                || !readDouble(obj, QStringLiteral("trafficShare"), &variant.trafficShare,
                               errorOut)) {
                return std::nullopt;
            }
            config.variants.push_back(variant);
        }
    }

    if (json.contains(QStringLiteral("defaultVariant"))) {
        config.defaultVariant = json.value(QStringLiteral("defaultVariant")).toString();
    }

    QJsonObject group;
    if (json.contains(QStringLiteral("similarityWeights"))) {
        SimilarityWeights& w = config.similarityWeights;
        if (!readObject(json, QStringLiteral("similarityWeights"), &group, errorOut)
            || !readDouble(group, QStringLiteral("visual"), &w.visual, errorOut)
            || !readDouble(group, QStringLiteral("textual"), &w.textual, errorOut)
            || !readDouble(group, QStringLiteral("categorical"), &w.categorical, errorOut)
            || !readDouble(group, QStringLiteral("behavioral"), &w.behavioral, errorOut)) {
            return std::nullopt;
        }
    }
    if (json.contains(QStringLiteral("businessWeights"))) {
        BusinessWeights& w = config.businessWeights;
        if (!readObject(json, QStringLiteral("businessWeights"), &group, errorOut)
            || !readDouble(group, QStringLiteral("popularity"), &w.popularity, errorOut)
            || !readDouble(group, QStringLiteral("stock"), &w.stock, errorOut)
            || !readDouble(group, QStringLiteral("price"), &w.price, errorOut)
            || !readDouble(group, QStringLiteral("conversion"), &w.conversion, errorOut)) {
            return std::nullopt;
        }
    }
    if (json.contains(QStringLiteral("personalizationWeights"))) {
        PersonalizationWeights& w = config.personalizationWeights;
        if (!readObject(json, QStringLiteral("personalizationWeights"), &group, errorOut)
            || !readDouble(group, QStringLiteral("preference"), &w.preference, errorOut)
            || !readDouble(group, QStringLiteral("behavioral"), &w.behavioral, errorOut)
            || !readDouble(group, QStringLiteral("session"), &w.session, errorOut)
            || !readDouble(group, QStringLiteral("temporal"), &w.temporal, errorOut)) {
            return std::nullopt;
        }
    }

    if (json.contains(QStringLiteral("constants"))) {
        ScoringConstants& c = config.constants;
        if (!readObject(json, QStringLiteral("constants"), &group, errorOut)
            || !readDouble(group, QStringLiteral("logisticSteepness"), &c.logisticSteepness, errorOut)
            || !readDouble(group, QStringLiteral("logisticMidpoint"), &c.logisticMidpoint, errorOut)
            || !readDouble(group, QStringLiteral("viewsCap"), &c.viewsCap, errorOut)
            || !readDouble(group, QStringLiteral("purchasesCap"), &c.purchasesCap, errorOut)
            || !readDouble(group, QStringLiteral("reviewsCap"), &c.reviewsCap, errorOut)
            || !readDouble(group, QStringLiteral("ratingScale"), &c.ratingScale, errorOut)
            || !readDouble(group, QStringLiteral("conversionRateCap"), &c.conversionRateCap, errorOut)
            || !readDouble(group, QStringLiteral("addToCartRateCap"), &c.addToCartRateCap, errorOut)
            || !readDouble(group, QStringLiteral("returnRateCap"), &c.returnRateCap, errorOut)
            || !readDouble(group, QStringLiteral("shippingCostCap"), &c.shippingCostCap, errorOut)
            || !readDouble(group, QStringLiteral("shippingDaysCap"), &c.shippingDaysCap, errorOut)
            || !readInt(group, QStringLiteral("topCategoryCount"), &c.topCategoryCount, errorOut)
            || !readDouble(group, QStringLiteral("priceSensitiveThreshold"),
                           &c.priceSensitiveThreshold, errorOut)
            || !readDouble(group, QStringLiteral("mobileSimilarityFactor"),
                           &c.mobileSimilarityFactor, errorOut)
            || !readDouble(group, QStringLiteral("reasonThreshold"), &c.reasonThreshold, errorOut)
            || !readInt(group, QStringLiteral("maxReasons"), &c.maxReasons, errorOut)) {
            return std::nullopt;
        }
    }

    if (json.contains(QStringLiteral("experiment"))) {
        ExperimentSettings& e = config.experiment;
        if (!readObject(json, QStringLiteral("experiment"), &group, errorOut)
            || !readInt(group, QStringLiteral("minImpressionSample"), &e.minImpressionSample, errorOut)
            || !readInt(group, QStringLiteral("minClickSample"), &e.minClickSample, errorOut)
            || !readDouble(group, QStringLiteral("significanceZ"), &e.significanceZ, errorOut)
            || !readInt(group, QStringLiteral("retentionDays"), &e.retentionDays, errorOut)) {
            return std::nullopt;
        }
    }

    if (json.contains(QStringLiteral("seasonalCategories"))) {
        if (!readObject(json, QStringLiteral("seasonalCategories"), &group, errorOut)) {
            return std::nullopt;
        }
        config.seasonalCategories.clear();
        for (auto it = group.begin(); it != group.end(); ++it) {
            if (!it.value().isArray()) {
                setError(errorOut, QStringLiteral("seasonalCategories.%1 must be an array")
                                       .arg(it.key()));
                return std::nullopt;
            }
            SeasonalCategory season;
            season.keyword = it.key().toLower();
            for (const QJsonValue& month : it.value().toArray()) {
                season.months.push_back(month.toInt(0));
            }
            config.seasonalCategories.push_back(season);
        }
    }

    if (!readInt(json, QStringLiteral("workerThreads"), &config.workerThreads, errorOut)
        || !readInt(json, QStringLiteral("defaultTimeoutMs"), &config.defaultTimeoutMs, errorOut)) {
        return std::nullopt;
    }

    if (!config.validate(errorOut)) {
        return std::nullopt;
    }
    return config;
}

std::optional<RankingConfig> RankingConfig::loadFromFile(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorOut, QStringLiteral("cannot open config file %1").arg(path));
        LOG_ERROR(srConfig, "RankingConfig: cannot open %s", qUtf8Printable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorOut, QStringLiteral("invalid config JSON in %1: %2")
                               .arg(path, parseError.errorString()));
        LOG_ERROR(srConfig, "RankingConfig: JSON parse error in %s: %s",
                  qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    QString error;
    std::optional<RankingConfig> config = fromJson(doc.object(), &error);
    if (!config.has_value()) {
        LOG_ERROR(srConfig, "RankingConfig: rejected %s: %s",
                  qUtf8Printable(path), qUtf8Printable(error));
        setError(errorOut, error);
        return std::nullopt;
    }

    LOG_INFO(srConfig, "RankingConfig: loaded %d variant(s) from %s",
             static_cast<int>(config->variants.size()), qUtf8Printable(path));
    return config;
}

bool RankingConfig::validate(QString* errorOut) const
{
    if (variants.empty()) {
        setError(errorOut, QStringLiteral("at least one variant is required"));
        return false;
    }

    QSet<QString> seen;
    double totalTraffic = 0.0;
    for (const VariantConfig& variant : variants) {
        if (variant.name.isEmpty()) {
            setError(errorOut, QStringLiteral("variant name must not be empty"));
            return false;
        }
        if (seen.contains(variant.name)) {
            setError(errorOut, QStringLiteral("duplicate variant '%1'").arg(variant.name));
            return false;
        }
        seen.insert(variant.name);

        const CategoryWeights& w = variant.weights;
        if (!checkWeightGroup(QStringLiteral("variant '%1'").arg(variant.name),
                              {w.similarity, w.business, w.personalization, w.geographic},
                              errorOut)) {
            return false;
        }
        if (!std::isfinite(variant.trafficShare) || variant.trafficShare < 0.0) {
            setError(errorOut, QStringLiteral("variant '%1': trafficShare must be >= 0")
                                   .arg(variant.name));
            return false;
        }
        totalTraffic += variant.trafficShare;
    }
    if (totalTraffic <= 0.0) {
        setError(errorOut, QStringLiteral("variant traffic shares sum to zero"));
        return false;
    }

    if (!findVariant(defaultVariant)) {
        setError(errorOut, QStringLiteral("unknown default variant '%1'").arg(defaultVariant));
        return false;
    }

    const SimilarityWeights& s = similarityWeights;
    const BusinessWeights& b = businessWeights;
    const PersonalizationWeights& p = personalizationWeights;
    if (!checkWeightGroup(QStringLiteral("similarityWeights"),
                          {s.visual, s.textual, s.categorical, s.behavioral}, errorOut)
        || !checkWeightGroup(QStringLiteral("businessWeights"),
                             {b.popularity, b.stock, b.price, b.conversion}, errorOut)
        || !checkWeightGroup(QStringLiteral("personalizationWeights"),
                             {p.preference, p.behavioral, p.session, p.temporal}, errorOut)) {
        return false;
    }

    const ScoringConstants& c = constants;
    if (!checkPositive(QStringLiteral("logisticSteepness"), c.logisticSteepness, errorOut)
        || !checkPositive(QStringLiteral("viewsCap"), c.viewsCap, errorOut)
        || !checkPositive(QStringLiteral("purchasesCap"), c.purchasesCap, errorOut)
        || !checkPositive(QStringLiteral("reviewsCap"), c.reviewsCap, errorOut)
        || !checkPositive(QStringLiteral("ratingScale"), c.ratingScale, errorOut)
        || !checkPositive(QStringLiteral("conversionRateCap"), c.conversionRateCap, errorOut)
        || !checkPositive(QStringLiteral("addToCartRateCap"), c.addToCartRateCap, errorOut)
        || !checkPositive(QStringLiteral("returnRateCap"), c.returnRateCap, errorOut)
        || !checkPositive(QStringLiteral("shippingCostCap"), c.shippingCostCap, errorOut)
        || !checkPositive(QStringLiteral("shippingDaysCap"), c.shippingDaysCap, errorOut)
        || !checkPositive(QStringLiteral("mobileSimilarityFactor"), c.mobileSimilarityFactor,
                          errorOut)) {
        return false;
    }
    if (!std::isfinite(c.logisticMidpoint) || c.logisticMidpoint < -1.0
        || c.logisticMidpoint > 1.0) {
        setError(errorOut, QStringLiteral("constants.logisticMidpoint must lie in [-1,1]"));
        return false;
    }
    if (c.topCategoryCount < 1) {
        setError(errorOut, QStringLiteral("constants.topCategoryCount must be >= 1"));
        return false;
    }
    if (c.maxReasons < 0) {
        setError(errorOut, QStringLiteral("constants.maxReasons must be >= 0"));
        return false;
    }
    if (c.reasonThreshold < 0.0 || c.reasonThreshold > 1.0
        || c.priceSensitiveThreshold < 0.0 || c.priceSensitiveThreshold > 1.0) {
        setError(errorOut, QStringLiteral("constants thresholds must lie in [0,1]"));
        return false;
    }

    if (experiment.minImpressionSample < 1 || experiment.minClickSample < 1) {
        setError(errorOut, QStringLiteral("experiment minimum sample sizes must be >= 1"));
        return false;
    }
    if (experiment.retentionDays < 1) {
        setError(errorOut, QStringLiteral("experiment.retentionDays must be >= 1"));
        return false;
    }
    if (!std::isfinite(experiment.significanceZ) || experiment.significanceZ < 0.0) {
        setError(errorOut, QStringLiteral("experiment.significanceZ must be >= 0"));
        return false;
    }

    for (const SeasonalCategory& season : seasonalCategories) {
        if (season.keyword.isEmpty()) {
            setError(errorOut, QStringLiteral("seasonalCategories keys must not be empty"));
            return false;
        }
        for (int month : season.months) {
            if (month < 1 || month > 12) {
                setError(errorOut, QStringLiteral("seasonalCategories.%1: month %2 out of range")
                                       .arg(season.keyword)
                                       .arg(month));
                return false;
            }
        }
    }

    if (workerThreads < 0 || defaultTimeoutMs < 0) {
        setError(errorOut, QStringLiteral("workerThreads and defaultTimeoutMs must be >= 0"));
        return false;
    }

    return true;
}

QJsonObject RankingConfig::toJson() const
{
    QJsonObject json;

    QJsonArray variantsArray;
    for (const VariantConfig& variant : variants) {
        QJsonObject obj;
        obj.insert(QStringLiteral("name"), variant.name);
        obj.insert(QStringLiteral("weights"), categoryWeightsToJson(variant.weights));
        obj.insert(QStringLiteral("trafficShare"), variant.trafficShare);
        variantsArray.append(obj);
    }
    json.insert(QStringLiteral("variants"), variantsArray);
    json.insert(QStringLiteral("defaultVariant"), defaultVariant);

    QJsonObject similarity;
    similarity.insert(QStringLiteral("visual"), similarityWeights.visual);
    similarity.insert(QStringLiteral("textual"), similarityWeights.textual);
    similarity.insert(QStringLiteral("categorical"), similarityWeights.categorical);
    similarity.insert(QStringLiteral("behavioral"), similarityWeights.behavioral);
    json.insert(QStringLiteral("similarityWeights"), similarity);

    QJsonObject business;
    business.insert(QStringLiteral("popularity"), businessWeights.popularity);
    business.insert(QStringLiteral("stock"), businessWeights.stock);
    business.insert(QStringLiteral("price"), businessWeights.price);
    business.insert(QStringLiteral("conversion"), businessWeights.conversion);
    json.insert(QStringLiteral("businessWeights"), business);

    QJsonObject personalization;
    personalization.insert(QStringLiteral("preference"), personalizationWeights.preference);
    personalization.insert(QStringLiteral("behavioral"), personalizationWeights.behavioral);
    personalization.insert(QStringLiteral("session"), personalizationWeights.session);
    personalization.insert(QStringLiteral("temporal"), personalizationWeights.temporal);
    json.insert(QStringLiteral("personalizationWeights"), personalization);

    QJsonObject c;
    c.insert(QStringLiteral("logisticSteepness"), constants.logisticSteepness);
    c.insert(QStringLiteral("logisticMidpoint"), constants.logisticMidpoint);
    c.insert(QStringLiteral("viewsCap"), constants.viewsCap);
    c.insert(QStringLiteral("purchasesCap"), constants.purchasesCap);
    c.insert(QStringLiteral("reviewsCap"), constants.reviewsCap);
    c.insert(QStringLiteral("ratingScale"), constants.ratingScale);
    c.insert(QStringLiteral("conversionRateCap"), constants.conversionRateCap);
    c.insert(QStringLiteral("addToCartRateCap"), constants.addToCartRateCap);
    c.insert(QStringLiteral("returnRateCap"), constants.returnRateCap);
    c.insert(QStringLiteral("shippingCostCap"), constants.shippingCostCap);
    c.insert(QStringLiteral("shippingDaysCap"), constants.shippingDaysCap);
    c.insert(QStringLiteral("topCategoryCount"), constants.topCategoryCount);
    c.insert(QStringLiteral("priceSensitiveThreshold"), constants.priceSensitiveThreshold);
    c.insert(QStringLiteral("mobileSimilarityFactor"), constants.mobileSimilarityFactor);
    c.insert(QStringLiteral("reasonThreshold"), constants.reasonThreshold);
    c.insert(QStringLiteral("maxReasons"), constants.maxReasons);
    json.insert(QStringLiteral("constants"), c);

    QJsonObject e;
    e.insert(QStringLiteral("minImpressionSample"), experiment.minImpressionSample);
    e.insert(QStringLiteral("minClickSample"), experiment.minClickSample);
    e.insert(QStringLiteral("significanceZ"), experiment.significanceZ);
    e.insert(QStringLiteral("retentionDays"), experiment.retentionDays);
    json.insert(QStringLiteral("experiment"), e);

    QJsonObject seasons;
    for (const SeasonalCategory& season : seasonalCategories) {
        QJsonArray months;
        for (int month : season.months) {
            months.append(month);
        }
        seasons.insert(season.keyword, months);
    }
    json.insert(QStringLiteral("seasonalCategories"), seasons);

    json.insert(QStringLiteral("workerThreads"), workerThreads);
    json.insert(QStringLiteral("defaultTimeoutMs"), defaultTimeoutMs);
    return json;
}

} // namespace sr
