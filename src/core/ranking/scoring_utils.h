#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

namespace sr {

// Clamp to [0,1]; non-finite input degrades to 0.
inline double clampUnit(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

inline double finiteOr(double value, double fallback)
{
    return std::isfinite(value) ? value : fallback;
}

// Case-insensitive lookup into a caller-supplied map. Exact keys win.
template <typename T>
std::optional<T> lookupIgnoreCase(const QHash<QString, T>& map, const QString& key)
{
    if (key.isEmpty()) {
        return std::nullopt;
    }
    const auto exact = map.constFind(key);
    if (exact != map.constEnd()) {
        return exact.value();
    }
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (it.key().compare(key, Qt::CaseInsensitive) == 0) {
            return it.value();
        }
    }
    return std::nullopt;
}

inline bool containsIgnoreCase(const QStringList& list, const QString& value)
{
    return !value.isEmpty() && list.contains(value, Qt::CaseInsensitive);
}

// The user's N most frequent categories, ties broken by name.
inline QStringList topCategories(const UserContext& user, int count)
{
    std::vector<std::pair<QString, int>> entries;
    entries.reserve(static_cast<size_t>(user.categoryFrequency.size()));
    for (auto it = user.categoryFrequency.constBegin();
         it != user.categoryFrequency.constEnd(); ++it) {
        if (it.value() > 0) {
            entries.emplace_back(it.key(), it.value());
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  if (a.second != b.second) {
                      return a.second > b.second;
                  }
                  return a.first < b.first;
              });

    QStringList out;
    for (const auto& entry : entries) {
        if (out.size() >= count) {
            break;
        }
        out.append(entry.first);
    }
    return out;
}

// Brand loyalty in [0,1]: explicit preference strength if present, otherwise
// the brand's share of the user's brand interaction history.
inline double brandLoyalty(const UserContext& user, const QString& brand)
{
    if (brand.isEmpty()) {
        return 0.0;
    }
    if (const auto preference = lookupIgnoreCase(user.brandPreferences, brand)) {
        return clampUnit(*preference);
    }

    int total = 0;
    for (int count : user.brandFrequency) {
        total += std::max(0, count);
    }
    if (total <= 0) {
        return 0.0;
    }
    const int count = lookupIgnoreCase(user.brandFrequency, brand).value_or(0);
    return clampUnit(static_cast<double>(std::max(0, count)) / total);
}

} // namespace sr
