#include "core/query/intent_classifier.h"
#include "core/query/query_normalizer.h"

namespace sr {

namespace {

struct PhrasePattern {
    const char* phrase;
    SearchIntent intent;
};

constexpr PhrasePattern kPhrasePatterns[] = {
    {"side by side",    SearchIntent::Compare},
    {"difference between", SearchIntent::Compare},
    {"how to choose",   SearchIntent::Research},
    {"buying guide",    SearchIntent::Research},
    {"best rated",      SearchIntent::Research},
    {"add to cart",     SearchIntent::Purchase},
    {"free shipping",   SearchIntent::Purchase},
    {"gift ideas",      SearchIntent::Browse},
    {"new arrivals",    SearchIntent::Browse},
};

struct KeywordPattern {
    const char* keyword;
    SearchIntent intent;
};

constexpr KeywordPattern kKeywordPatterns[] = {
    {"vs",          SearchIntent::Compare},
    {"versus",      SearchIntent::Compare},
    {"compare",     SearchIntent::Compare},
    {"comparison",  SearchIntent::Compare},
    {"alternative", SearchIntent::Compare},
    {"alternatives", SearchIntent::Compare},
    {"buy",         SearchIntent::Purchase},
    {"order",       SearchIntent::Purchase},
    {"cheap",       SearchIntent::Purchase},
    {"deal",        SearchIntent::Purchase},
    {"deals",       SearchIntent::Purchase},
    {"sale",        SearchIntent::Purchase},
    {"discount",    SearchIntent::Purchase},
    {"review",      SearchIntent::Research},
    {"reviews",     SearchIntent::Research},
    {"rating",      SearchIntent::Research},
    {"specs",       SearchIntent::Research},
    {"specifications", SearchIntent::Research},
    {"guide",       SearchIntent::Research},
    {"ideas",       SearchIntent::Browse},
    {"inspiration", SearchIntent::Browse},
    {"trending",    SearchIntent::Browse},
    {"popular",     SearchIntent::Browse},
};

} // namespace

std::optional<SearchIntent> IntentClassifier::classify(const QString& queryText)
{
    const QString normalized = QueryNormalizer::normalize(queryText).normalized;
    if (normalized.isEmpty()) {
        return std::nullopt;
    }

    for (const auto& pattern : kPhrasePatterns) {
        if (normalized.contains(QString::fromLatin1(pattern.phrase))) {
            return pattern.intent;
        }
    }

    const QStringList tokens = QueryNormalizer::tokenize(queryText);
    for (const auto& pattern : kKeywordPatterns) {
        const QString keyword = QString::fromLatin1(pattern.keyword);
        for (const QString& token : tokens) {
            if (token == keyword) {
                return pattern.intent;
            }
        }
    }

    return std::nullopt;
}

} // namespace sr
