#include "VersionComparator.hpp"

namespace pem {

static bool isAsciiDigit(QChar c)
{
    return c >= QLatin1Char('0') && c <= QLatin1Char('9');
}

static bool isAsciiLetter(QChar c)
{
    return (c >= QLatin1Char('a') && c <= QLatin1Char('z'))
        || (c >= QLatin1Char('A') && c <= QLatin1Char('Z'));
}

QList<VersionComparator::Token> VersionComparator::tokenize(const QString& version)
{
    QList<Token> tokens;
    QString digits;
    QString letters;

    auto flushDigits = [&]() {
        if (digits.isEmpty()) return;
        bool ok = false;
        quint64 n = digits.toULongLong(&ok);
        // Runs that overflow 64 bits are dropped
        if (ok) {
            Token t;
            t.numeric = true;
            t.number = n;
            tokens.append(t);
        }
        digits.clear();
    };
    auto flushLetters = [&]() {
        if (letters.isEmpty()) return;
        Token t;
        t.numeric = false;
        t.text = letters.toLower();
        tokens.append(t);
        letters.clear();
    };

    for (QChar c : version) {
        if (isAsciiDigit(c)) {
            flushLetters();
            digits.append(c);
        } else if (isAsciiLetter(c)) {
            flushDigits();
            letters.append(c);
        } else {
            flushDigits();
            flushLetters();
        }
    }
    flushDigits();
    flushLetters();

    return tokens;
}

int VersionComparator::compareTokens(const Token& a, const Token& b)
{
    if (a.numeric && b.numeric) {
        if (a.number == b.number) return 0;
        return a.number < b.number ? -1 : 1;
    }
    if (!a.numeric && !b.numeric) {
        int c = a.text.compare(b.text);
        return c == 0 ? 0 : (c < 0 ? -1 : 1);
    }
    return a.numeric ? -1 : 1;
}

int VersionComparator::compare(const QString& a, const QString& b)
{
    const auto left = tokenize(a);
    const auto right = tokenize(b);
    const Token zero;

    const int count = qMax(left.size(), right.size());
    for (int i = 0; i < count; ++i) {
        const Token& l = i < left.size() ? left[i] : zero;
        const Token& r = i < right.size() ? right[i] : zero;
        int c = compareTokens(l, r);
        if (c != 0)
            return c;
    }
    return 0;
}

} // namespace pem
