#pragma once

#include <QString>
#include <QStringList>
#include <vector>

namespace pc {

// A token is a maximal run of letters, digits or combining marks, classified
// per code point. Offsets are UTF-16 indices into the source string, end
// exclusive.
struct TextToken {
    QString term;   // case-folded
    int start = 0;
    int end = 0;
};

// Used by both the chunker and the keyword index, for documents and queries
// alike. Locale-independent.
class TextTokenizer {
public:
    static std::vector<TextToken> tokenize(const QString& text);

    // Case-folded terms only, in order.
    static QStringList terms(const QString& text);

    static int countTokens(const QString& text);
};

} // namespace pc
