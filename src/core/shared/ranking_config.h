#pragma once

#include "core/shared/scoring_types.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace sr {

constexpr double kWeightEpsilon = 1e-6;

// Tunable constants of the scoring functions. Product-tuning choices; every
// one of them can be overridden from the config file.
struct ScoringConstants {
    double logisticSteepness = 10.0;
    double logisticMidpoint = 0.5;
    double viewsCap = 10000.0;
    double purchasesCap = 1000.0;
    double reviewsCap = 500.0;
    double ratingScale = 5.0;
    double conversionRateCap = 0.20;
    double addToCartRateCap = 0.30;
    double returnRateCap = 0.10;
    double shippingCostCap = 50.0;
    double shippingDaysCap = 14.0;
    int topCategoryCount = 3;
    double priceSensitiveThreshold = 0.7;
    double mobileSimilarityFactor = 1.2;   // 1.0 disables the mobile adjustment
    double reasonThreshold = 0.5;
    int maxReasons = 3;
};

struct ExperimentSettings {
    int minImpressionSample = 100;   // recommend() CTR gate
    int minClickSample = 50;         // recommend() conversion gate
    double significanceZ = 1.96;
    int retentionDays = 30;
};

struct VariantConfig {
    QString name;
    CategoryWeights weights;
    double trafficShare = 1.0;  // relative; normalized across variants
};

struct SeasonalCategory {
    QString keyword;          // matched as a substring of the lowercased category
    std::vector<int> months;  // 1-12
};

// RankingConfig -- static configuration loaded once at startup.
//
// fromJson() starts from defaults() and overlays whatever keys are present.
// A present key with the wrong type, or any value that breaks validate(),
// rejects the whole configuration.
struct RankingConfig {
    std::vector<VariantConfig> variants;
    QString defaultVariant;

    SimilarityWeights similarityWeights;
    BusinessWeights businessWeights;
    PersonalizationWeights personalizationWeights;
    ScoringConstants constants;
    ExperimentSettings experiment;
    std::vector<SeasonalCategory> seasonalCategories;

    int workerThreads = 0;     // 0 = hardware concurrency
    int defaultTimeoutMs = 0;  // 0 = no deadline unless the request carries one

    static RankingConfig defaults();
    static std::optional<RankingConfig> fromJson(const QJsonObject& json,
                                                 QString* errorOut = nullptr);
    static std::optional<RankingConfig> loadFromFile(const QString& path,
                                                     QString* errorOut = nullptr);

    QJsonObject toJson() const;
    bool validate(QString* errorOut = nullptr) const;

    const VariantConfig* findVariant(const QString& name) const;
};

} // namespace sr
