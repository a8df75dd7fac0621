#include "core/shared/types.h"

namespace sr {

QString searchIntentToString(SearchIntent intent)
{
    switch (intent) {
    case SearchIntent::Browse:   return QStringLiteral("browse");
    case SearchIntent::Purchase: return QStringLiteral("purchase");
    case SearchIntent::Research: return QStringLiteral("research");
    case SearchIntent::Compare:  return QStringLiteral("compare");
    case SearchIntent::Unknown:  return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

SearchIntent searchIntentFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("browse"))   return SearchIntent::Browse;
    if (lower == QLatin1String("purchase")) return SearchIntent::Purchase;
    if (lower == QLatin1String("research")) return SearchIntent::Research;
    if (lower == QLatin1String("compare"))  return SearchIntent::Compare;
    return SearchIntent::Unknown;
}

QString eventKindToString(EventKind kind)
{
    switch (kind) {
    case EventKind::Impression: return QStringLiteral("impression");
    case EventKind::Click:      return QStringLiteral("click");
    case EventKind::Purchase:   return QStringLiteral("purchase");
    }
    return QStringLiteral("impression");
}

std::optional<EventKind> eventKindFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("impression") || lower == QLatin1String("view")) {
        return EventKind::Impression;
    }
    if (lower == QLatin1String("click")) {
        return EventKind::Click;
    }
    if (lower == QLatin1String("purchase")) {
        return EventKind::Purchase;
    }
    return std::nullopt;
}

} // namespace sr
