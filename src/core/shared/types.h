#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace sr {

// Inferred or caller-supplied purpose of a search.
enum class SearchIntent {
    Browse,
    Purchase,
    Research,
    Compare,
    Unknown,
};

QString searchIntentToString(SearchIntent intent);
SearchIntent searchIntentFromString(const QString& str);

// Interaction recorded against a ranked result.
enum class EventKind {
    Impression,
    Click,
    Purchase,
};

QString eventKindToString(EventKind kind);
// Accepts "view" as an alias of "impression".
std::optional<EventKind> eventKindFromString(const QString& str);

struct PriceRange {
    double min = 0.0;
    double max = 0.0;

    bool contains(double price) const { return price >= min && price <= max; }
};

// One ranking request's query input. Every field is optional; a request with
// nothing set still ranks by business signals.
struct QueryContext {
    std::optional<QString> text;
    std::optional<std::vector<float>> vector;
    std::optional<QString> targetCategory;
    std::optional<double> minPrice;
    std::optional<double> maxPrice;
    std::optional<SearchIntent> intent;
};

struct ProductCandidate {
    QString id;
    std::vector<float> vector;

    // Text
    QString title;
    QString description;
    QString brand;
    QString category;
    QString subcategory;
    QStringList tags;

    // Commerce
    double price = 0.0;
    double originalPrice = 0.0;       // 0 = no original price known
    double categoryAvgPrice = 0.0;    // 0 = no category average known
    int stockQuantity = 0;
    bool inStock = true;
    bool backorderable = false;
    double popularityScore = 0.0;
    int64_t viewCount = 0;
    int64_t purchaseCount = 0;
    int64_t returnCount = 0;
    double rating = 0.0;
    int reviewCount = 0;
    std::optional<double> conversionRate;
    std::optional<double> addToCartRate;
    std::optional<double> returnRate;
    bool isTrending = false;
    bool hasSpecifications = false;

    // Geography
    QStringList availableRegions;
    std::optional<double> shippingCost;
    std::optional<double> shippingDays;
    QHash<QString, double> regionalPopularity;  // country -> [0,1]
};

struct UserContext {
    QString userId;
    QHash<QString, double> categoryPreferences;  // category -> [0,1]
    QHash<QString, double> brandPreferences;     // brand -> [0,1]
    std::optional<PriceRange> preferredPriceRange;
    QHash<QString, int> categoryFrequency;
    QHash<QString, int> brandFrequency;
    QStringList viewedProductIds;
    std::vector<int> preferredPurchaseHours;
    double averagePurchasePrice = 0.0;
    double priceSensitivity = 0.5;  // 0 = insensitive, 1 = very sensitive
    QString deviceType;
    std::optional<int> hourOfDay;
};

struct GeoContext {
    QString country;
    QString region;
};

} // namespace sr
