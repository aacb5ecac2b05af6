#pragma once

#include <QList>
#include <QString>
#include <QtGlobal>

namespace pem {

/// Orders free-form version strings such as "1.10.0", "2.0-beta", "v3b2".
///
/// Digit runs become numeric tokens, ASCII letter runs become lowercase text
/// tokens, everything else separates runs. The shorter token list is padded
/// with numeric zeros. A numeric token always sorts before a text token.
class VersionComparator {
public:
    struct Token {
        bool numeric = true;
        quint64 number = 0;
        QString text;

        bool operator==(const Token& other) const
        {
            return numeric == other.numeric && number == other.number && text == other.text;
        }
    };

    /// Returns -1 when a < b, 0 when equal, 1 when a > b.
    static int compare(const QString& a, const QString& b);

    static QList<Token> tokenize(const QString& version);

private:
    static int compareTokens(const Token& a, const Token& b);
};

} // namespace pem
