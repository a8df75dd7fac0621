#include "core/query/query_normalizer.h"

#include <QRegularExpression>

namespace sr {

namespace {

bool isDash(QChar ch)
{
    const char16_t code = ch.unicode();
    return (code >= 0x2010 && code <= 0x2015) || code == 0x2212;
}

// Characters that separate words in catalog text ("usb-c/thunderbolt", "a|b").
bool isSeparator(QChar ch)
{
    switch (ch.unicode()) {
    case '/':
    case '\\':
    case '|':
    case ',':
    case ';':
    case ':':
        return true;
    default:
        return false;
    }
}

bool isNoise(QChar ch)
{
    switch (ch.unicode()) {
    case '!': case '?': case '$': case '@': case '#': case '%':
    case '^': case '&': case '*': case '(': case ')': case '{':
    case '}': case '[': case ']': case '<': case '>': case '~':
    case '`': case '"': case '\'':
    case 0x00A9:  // ©
    case 0x00AE:  // ®
    case 0x2122:  // ™
    case 0x2018: case 0x2019: case 0x201C: case 0x201D:
        return true;
    default:
        return false;
    }
}

QString stripOuterQuotes(const QString& text)
{
    if (text.size() < 2) {
        return text;
    }
    const QChar first = text.front();
    if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && text.back() == first) {
        return text.mid(1, text.size() - 2);
    }
    return text;
}

} // namespace

NormalizedQuery QueryNormalizer::normalize(const QString& raw)
{
    NormalizedQuery result;
    result.original = raw;

    const QString text = stripOuterQuotes(raw.trimmed());
    QString folded;
    folded.reserve(text.size());
    for (const QChar ch : text) {
        if (isDash(ch)) {
            folded.append(QLatin1Char('-'));
        } else if (isSeparator(ch)) {
            folded.append(QLatin1Char(' '));
        } else if (!isNoise(ch)) {
            folded.append(ch.toLower());
        }
    }

    // A hyphen survives only inside a word: "trail-running" keeps it,
    // "shoes - sale" and "--deal" do not.
    static const QRegularExpression kRepeatedHyphens(QStringLiteral("-{2,}"));
    static const QRegularExpression kDetachedHyphens(QStringLiteral("(^|\\s)-+|-+(?=\\s|$)"));
    folded.replace(kRepeatedHyphens, QStringLiteral("-"));
    folded.replace(kDetachedHyphens, QStringLiteral(" "));

    result.normalized = folded.simplified();
    return result;
}

QStringList QueryNormalizer::tokenize(const QString& raw)
{
    static const QRegularExpression kNonWord(QStringLiteral("[^\\p{L}\\p{N}]+"));
    return normalize(raw).normalized.split(kNonWord, Qt::SkipEmptyParts);
}

} // namespace sr
