#pragma once

#include <QString>
#include <QStringList>

namespace sr {

struct NormalizedQuery {
    QString original;
    QString normalized;  // lowercased, noise-free, single-spaced
};

// QueryNormalizer -- canonical form of free text for matching queries
// against catalog titles, descriptions, brands and categories.
class QueryNormalizer {
public:
    static NormalizedQuery normalize(const QString& raw);

    // Word tokens of the normalized text, split on whitespace, hyphens and
    // any remaining punctuation. Duplicates are kept.
    static QStringList tokenize(const QString& raw);
};

} // namespace sr
