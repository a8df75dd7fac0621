#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace sr {

// Keyword-based search-intent inference for requests that do not carry an
// explicit intent. Phrases are checked before single keywords.
class IntentClassifier {
public:
    static std::optional<SearchIntent> classify(const QString& queryText);
};

} // namespace sr
