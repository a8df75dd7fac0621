#include "catalog_fixtures.h"

#include <algorithm>
#include <cmath>

namespace sr::test {

ProductCandidate makeCandidate(const QString& id, const QString& category,
                               double price, int stockQuantity)
{
    ProductCandidate c;
    c.id = id;
    c.title = QStringLiteral("Product %1").arg(id);
    c.description = QStringLiteral("Catalog item %1").arg(id);
    c.brand = QStringLiteral("Acme");
    c.category = category;
    c.price = price;
    c.categoryAvgPrice = price;
    c.stockQuantity = stockQuantity;
    c.inStock = stockQuantity > 0;
    c.popularityScore = 0.5;
    c.viewCount = 1000;
    c.purchaseCount = 50;
    c.rating = 4.0;
    c.reviewCount = 40;
    return c;
}

std::vector<float> unitVector(int dims, int axis)
{
    std::vector<float> v(static_cast<size_t>(dims), 0.0f);
    v[static_cast<size_t>(axis)] = 1.0f;
    return v;
}

std::vector<float> vectorWithCosine(double cosine, int dims)
{
    std::vector<float> v(static_cast<size_t>(dims), 0.0f);
    v[0] = static_cast<float>(cosine);
    v[1] = static_cast<float>(std::sqrt(std::max(0.0, 1.0 - cosine * cosine)));
    return v;
}

UserContext makeShopper(const QString& userId)
{
    UserContext user;
    user.userId = userId;
    user.categoryFrequency.insert(QStringLiteral("footwear"), 6);
    user.categoryFrequency.insert(QStringLiteral("books"), 2);
    user.brandPreferences.insert(QStringLiteral("Acme"), 0.8);
    user.preferredPriceRange = PriceRange{40.0, 120.0};
    user.deviceType = QStringLiteral("desktop");
    return user;
}

GeoContext makeGeo(const QString& country)
{
    GeoContext geo;
    geo.country = country;
    geo.region = QStringLiteral("west");
    return geo;
}

QDateTime fixedRequestTime()
{
    return QDateTime(QDate(2026, 12, 14), QTime(10, 0), Qt::UTC);
}

ExperimentEvent makeEvent(const QString& sessionId, const QString& variant,
                          const QString& candidateId, EventKind kind,
                          const QDateTime& timestamp, int position)
{
    ExperimentEvent event;
    event.sessionId = sessionId;
    event.variantName = variant;
    event.candidateId = candidateId;
    event.kind = kind;
    event.position = position;
    event.timestamp = timestamp;
    return event;
}

} // namespace sr::test
