#pragma once

#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace sr {

// Top-level signal families combined by a variant.
struct CategoryWeights {
    double similarity = 0.0;
    double business = 0.0;
    double personalization = 0.0;
    double geographic = 0.0;

    double sum() const { return similarity + business + personalization + geographic; }
};

// Intra-category reductions. Each group sums to 1.0.
struct SimilarityWeights {
    double visual = 0.4;
    double textual = 0.3;
    double categorical = 0.2;
    double behavioral = 0.1;
};

struct BusinessWeights {
    double popularity = 0.25;
    double stock = 0.35;
    double price = 0.20;
    double conversion = 0.20;
};

struct PersonalizationWeights {
    double preference = 0.30;
    double behavioral = 0.30;
    double session = 0.20;
    double temporal = 0.20;
};

// A sub-metric that is not applicable for a request (missing vector, missing
// user, ...) is excluded from its category's weight renormalization.
struct SubScore {
    double value = 0.0;
    bool applicable = false;
};

struct SimilarityScores {
    SubScore visual;
    SubScore textual;
    SubScore categorical;
    SubScore behavioral;
};

struct BusinessScores {
    SubScore popularity;
    SubScore stock;
    SubScore price;
    SubScore conversion;
    SubScore geographic;
};

struct PersonalizationScores {
    SubScore preference;
    SubScore behavioral;
    SubScore session;
    SubScore temporal;
};

// Per-candidate explanation of how the final score was derived.
struct ScoreBreakdown {
    double similarity = 0.0;
    double business = 0.0;
    double personalization = 0.0;
    double geographic = 0.0;
    CategoryWeights effectiveWeights;

    SimilarityScores similarityDetail;
    BusinessScores businessDetail;
    PersonalizationScores personalizationDetail;

    double finalScore = 0.0;
    std::vector<QString> reasons;
};

struct RankedCandidate {
    ProductCandidate candidate;
    int rank = 0;            // 1-based
    double finalScore = 0.0;
    ScoreBreakdown breakdown;
};

} // namespace sr
