#pragma once

#include "core/experiment/experiment_store.h"
#include "core/ranking/ranking_engine.h"

#include <QJsonObject>
#include <QMap>
#include <QString>

#include <optional>
#include <vector>

namespace sr {

// Facet counts over a result page.
struct FacetCounts {
    QMap<QString, int> brands;
    QMap<QString, int> categories;
    QMap<QString, int> priceRanges;  // "0-25", "25-50", "50-100", "100-200", "200+"
    QMap<QString, int> ratings;      // "1".."5"
};

FacetCounts computeFacets(const std::vector<RankedCandidate>& results);
QJsonObject facetsToJson(const FacetCounts& facets);

// A missing "query" object yields a request without QueryContext, which
// rank() rejects. A malformed query or a non-array "candidates" fails the
// conversion. Candidates without an id are skipped and counted in
// RankRequest::invalidCount; wrong-typed candidate fields keep their
// defaults.
std::optional<RankRequest> rankRequestFromJson(const QJsonObject& json,
                                               QString* errorOut = nullptr);

// Candidate vectors are omitted from the output.
QJsonObject rankResponseToJson(const RankResponse& response);
QJsonObject scoreBreakdownToJson(const ScoreBreakdown& breakdown);
QJsonObject categoryWeightsToJson(const CategoryWeights& weights);

// "timestamp" accepts ISO-8601 text or epoch milliseconds; absent = unset.
std::optional<ExperimentEvent> experimentEventFromJson(const QJsonObject& json,
                                                       QString* errorOut = nullptr);
QJsonObject experimentEventToJson(const ExperimentEvent& event);

} // namespace sr
